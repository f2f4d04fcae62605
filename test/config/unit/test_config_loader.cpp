/***
 * Name: test_config_loader
 * Purpose: `key = value` files: comments, continuation lines, dotted keys,
 *   warnings, errors and the dump/reload cycle.
 */
#include <gtest/gtest.h>
#include <cstdio>
#include <sstream>
#include "cmfmt/exceptions/config_error.h"
#include "config/ConfigLoader.h"

using namespace cmfmt;
using config::ConfigLiteral;

static std::string loadError(const std::string& text) {
  diag::DiagnosticSink sink;
  try {
    (void)config::LoadConfigString(text, "cfg.py", sink);
  } catch (const exceptions::ConfigError& e) {
    return e.what();
  }
  return {};
}

TEST(ConfigLoader, SampleFile) {
  const char* text =
      "# How wide to allow formatted cmake files\n"
      "line_width = 80\n"
      "\n"
      "# How many spaces to tab for indent\n"
      "tab_size = 2\n"
      "\n"
      "# If true, separate control flow names from the parentheses with a space\n"
      "separate_ctrl_name_with_space = False\n"
      "\n"
      "# If true, separate function names from the parenthesis with a space\n"
      "separate_fn_name_with_space = False\n";
  diag::DiagnosticSink sink;
  const auto cfg = config::LoadConfigString(text, "sample.py", sink);
  EXPECT_TRUE(sink.empty());
  EXPECT_EQ(cfg.lineWidth, 80);
  EXPECT_EQ(cfg.tabSize, 2);
  EXPECT_FALSE(cfg.separateCtrlNameWithSpace);
  EXPECT_FALSE(cfg.separateFnNameWithSpace);
}

TEST(ConfigLoader, ContinuationAndQuotedHash) {
  const char* text =
      "always_wrap = ['add_library',  # first\n"
      "               'target_link_libraries']\n"
      "bullet_char = '#'  # trailing comment\r\n"
      "algorithm_order = (4, 3,\n"
      "  2)\n";
  diag::DiagnosticSink sink;
  const auto cfg = config::LoadConfigString(text, "cfg.py", sink);
  EXPECT_TRUE(sink.empty());
  EXPECT_EQ(cfg.alwaysWrap, (std::vector<std::string>{"add_library", "target_link_libraries"}));
  EXPECT_EQ(cfg.bulletChar, "#");
  EXPECT_EQ(cfg.algorithmOrder, (std::vector<int>{4, 3, 2}));
}

TEST(ConfigLoader, UnknownKeysWarn) {
  diag::DiagnosticSink sink;
  const auto cfg = config::LoadConfigString("line_width = 90\nwidth = 10\nfoo.bar = 1\n", "cfg.py", sink);
  EXPECT_EQ(cfg.lineWidth, 90);
  ASSERT_EQ(sink.size(), 2u);
  EXPECT_EQ(sink.diagnostics()[0].message, "unknown configuration key 'width'");
  EXPECT_EQ(sink.diagnostics()[0].line, 2);
  EXPECT_EQ(sink.diagnostics()[1].line, 3);
  EXPECT_EQ(sink.errorCount(), 0u);
}

TEST(ConfigLoader, ErrorsCarryFileAndLine) {
  EXPECT_EQ(loadError("line_width = 80\ntab_size = '80'\n"),
            "cfg.py:2: invalid value for 'tab_size': expected an integer, got string '80'");
  const auto choice = loadError("\n\nline_ending = 'mac'\n");
  EXPECT_EQ(choice.rfind("cfg.py:3: ", 0), 0u);
  EXPECT_NE(choice.find("choose from windows, unix, auto"), std::string::npos);
  EXPECT_EQ(loadError("line_width\n"), "cfg.py:1: expected 'key = value'");
  EXPECT_EQ(loadError("line_width = [1,\n 2\n").rfind("cfg.py:1: malformed value", 0), 0u);
  EXPECT_EQ(loadError("additional_commands = {'x': {'nargs': 2}}\n").rfind("cfg.py:1: ", 0), 0u);
}

TEST(ConfigLoader, StringBooleans) {
  diag::DiagnosticSink sink;
  auto cfg = config::LoadConfigString("dangle_parens = 'yes'\nautosort = 'maybe'\n", "cfg.py", sink);
  EXPECT_TRUE(cfg.dangleParens);
  EXPECT_FALSE(cfg.autosort);
  ASSERT_EQ(sink.size(), 1u);
  EXPECT_EQ(sink.diagnostics()[0].message, "Ambiguous truthiness of string 'maybe' evaluates to 'FALSE'");
  EXPECT_EQ(sink.diagnostics()[0].line, 2);
}

TEST(ConfigLoader, AdditionalCommandsReplaceDefaults) {
  const char* text =
      "additional_commands = {\n"
      "  'My_Gen': {\n"
      "    'flags': ['verbose'],\n"
      "    'kwargs': {'OUTPUT': 1, 'INPUTS': '+'},\n"
      "    'required': ['OUTPUT'],\n"
      "  },\n"
      "}\n";
  diag::DiagnosticSink sink;
  const auto cfg = config::LoadConfigString(text, "cfg.py", sink);
  EXPECT_TRUE(sink.empty());
  EXPECT_FALSE(cfg.additionalCommands.contains("foo"));
  ASSERT_TRUE(cfg.additionalCommands.contains("my_gen"));
  const auto& spec = cfg.additionalCommands.at("my_gen");
  EXPECT_EQ(spec.flags, std::vector<std::string>{"VERBOSE"});
  EXPECT_EQ(spec.required, std::vector<std::string>{"OUTPUT"});

  const auto registry = config::BuildRegistry(cfg);
  EXPECT_TRUE(registry.contains("MY_GEN"));
  EXPECT_NE(registry.lookup("my_gen").findKeyword("INPUTS"), nullptr);
  EXPECT_FALSE(registry.contains("foo"));
}

TEST(ConfigLoader, DottedKeys) {
  const char* text =
      "additional_commands.foo.kwargs.EXTRA = 2\n"
      "additional_commands.gen.npargs = 1\n"
      "additional_commands.gen.kwargs = {'OUT': 1}\n"
      "additional_commands.gen.required = ['out']\n"
      "additional_commands.bare = '+'\n"
      "per_command.Add_Library.command_case = 'upper'\n";
  diag::DiagnosticSink sink;
  const auto cfg = config::LoadConfigString(text, "cfg.py", sink);
  EXPECT_TRUE(sink.empty());

  const auto& foo = cfg.additionalCommands.at("foo");
  ASSERT_NE(foo.findKeyword("EXTRA"), nullptr);
  EXPECT_EQ(foo.findKeyword("EXTRA")->npargs, grammar::NArgs::Exactly(2));
  EXPECT_NE(foo.findKeyword("HEADERS"), nullptr);

  const auto& gen = cfg.additionalCommands.at("gen");
  EXPECT_EQ(gen.kind, grammar::GrammarKind::Standard);
  EXPECT_EQ(gen.npargs, grammar::NArgs::Exactly(1));
  EXPECT_NE(gen.findKeyword("OUT"), nullptr);
  EXPECT_EQ(gen.required, std::vector<std::string>{"OUT"});

  EXPECT_EQ(cfg.additionalCommands.at("bare").kind, grammar::GrammarKind::Positional);
  EXPECT_EQ(cfg.resolveForCommand("add_library", "command_case"), ConfigLiteral::String("upper"));
}

TEST(ConfigLoader, PerCommandDict) {
  diag::DiagnosticSink sink;
  const auto cfg = config::LoadConfigString(
      "per_command = {'x': 5, 'Foo': {'line_width': 40, 'colour': 'red'}}\n", "cfg.py", sink);
  ASSERT_EQ(sink.size(), 2u);
  EXPECT_EQ(sink.diagnostics()[0].message, "Invalid override of type int for x");
  EXPECT_NE(sink.diagnostics()[1].message.find("colour"), std::string::npos);
  EXPECT_EQ(cfg.resolveForCommand("FOO", "line_width"), ConfigLiteral::Int(40));
  EXPECT_EQ(cfg.resolveForCommand("bar", "line_width"), ConfigLiteral::Int(80));
  EXPECT_NE(loadError("per_command.foo.line_width = 'wide'\n").find("cfg.py:1: "), std::string::npos);
}

TEST(ConfigLoader, UnreadableFile) {
  diag::DiagnosticSink sink;
  try {
    (void)config::LoadConfigFile("/nonexistent/cmfmt/config.py", sink);
    FAIL() << "expected ConfigError";
  } catch (const exceptions::ConfigError& e) {
    EXPECT_NE(std::string(e.what()).find("unable to read config file"), std::string::npos);
  }
}

TEST(ConfigLoader, LoadFromFile) {
  const std::string path = ::testing::TempDir() + "cmfmt_loader_test.py";
  {
    FILE* f = std::fopen(path.c_str(), "wb");
    ASSERT_NE(f, nullptr);
    std::fputs("tab_size = 4\n", f);
    std::fclose(f);
  }
  diag::DiagnosticSink sink;
  const auto cfg = config::LoadConfigFile(path, sink);
  EXPECT_EQ(cfg.tabSize, 4);
  std::remove(path.c_str());
}

TEST(ConfigLoader, DumpContainsEveryOption) {
  config::Configuration cfg;
  std::ostringstream os;
  config::DumpConfig(os, cfg);
  const auto text = os.str();
  EXPECT_EQ(text.rfind("# How wide to allow formatted cmake files\nline_width = 80\n\n", 0), 0u);
  for (const auto& field : config::ConfigFields()) {
    EXPECT_NE(text.find(std::string("\n") + field.name + " = "), std::string::npos) << field.name;
  }
  EXPECT_NE(text.find("additional_commands = {'foo': {'npargs': '*', 'flags': ['BAR', 'BAZ'], "
                      "'kwargs': {'DEPENDS': '*', 'HEADERS': '*', 'SOURCES': '*'}}}"),
            std::string::npos);
  EXPECT_NE(text.find("per_command = {}"), std::string::npos);
  EXPECT_NE(text.find("literal_comment_pattern = None"), std::string::npos);
}

TEST(ConfigLoader, DumpThenReload) {
  diag::DiagnosticSink sink;
  auto cfg = config::LoadConfigString(
      "line_width = 100\n"
      "keyword_case = 'upper'\n"
      "fence_pattern = '^\\\\s*```'\n"
      "additional_commands = {'gen': {'npargs': 1, 'kwargs': {'OUT': 1}, 'required': ['OUT'], 'sortable': True}}\n"
      "per_command = {'gen': {'dangle_parens': True}}\n",
      "cfg.py", sink);
  ASSERT_TRUE(sink.empty());
  std::ostringstream os;
  config::DumpConfig(os, cfg);

  const auto again = config::LoadConfigString(os.str(), "dump.py", sink);
  EXPECT_TRUE(sink.empty());
  for (const auto& field : config::ConfigFields()) {
    EXPECT_EQ(again.get(field.name), cfg.get(field.name)) << field.name;
  }
  EXPECT_EQ(again.get("additional_commands"), cfg.get("additional_commands"));
  EXPECT_EQ(again.get("per_command"), cfg.get("per_command"));
  EXPECT_EQ(again.fencePattern, "^\\s*```");
}
