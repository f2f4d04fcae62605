/***
 * Name: test_command_registry
 * Purpose: Descriptor builders, built-in table and lookup fallback.
 */
#include <gtest/gtest.h>
#include <algorithm>
#include "grammar/CommandRegistry.h"
#include "grammar/ConditionalFlags.h"

using namespace cmfmt::grammar;

static bool hasFlag(const ArgSpec& spec, const std::string& f) {
  return std::find(spec.flags.begin(), spec.flags.end(), f) != spec.flags.end();
}

TEST(ArgSpecBuilders, NormalizeKeywordsAndFlags) {
  ArgSpec spec = Standard(NArgs::OneOrMore(), {{"sources", Positional(NArgs::ZeroOrMore())}}, {"all", "ALL"});
  EXPECT_EQ(spec.kind, GrammarKind::Standard);
  ASSERT_NE(spec.findKeyword("SOURCES"), nullptr);
  EXPECT_EQ(spec.findKeyword("sources"), nullptr);
  ASSERT_EQ(spec.flags.size(), 1u);
  EXPECT_EQ(spec.flags[0], "ALL");
  EXPECT_EQ(spec.keywordNames(), std::vector<std::string>{"SOURCES"});
}

TEST(ArgSpecBuilders, PositionalAndRequire) {
  ArgSpec spec = Positional(NArgs::Exactly(2), {"force"}, true);
  EXPECT_EQ(spec.kind, GrammarKind::Positional);
  EXPECT_TRUE(spec.sortable);
  EXPECT_TRUE(hasFlag(spec, "FORCE"));
  EXPECT_EQ(spec.positional().npargs, NArgs::Exactly(2));

  Require(spec, {"version"});
  ASSERT_EQ(spec.required.size(), 1u);
  EXPECT_EQ(spec.required[0], "VERSION");
}

TEST(ArgSpecBuilders, ConditionalHasAndOr) {
  ArgSpec spec = Conditional();
  EXPECT_EQ(spec.kind, GrammarKind::Conditional);
  const auto* andBody = spec.findKeyword("AND");
  const auto* orBody = spec.findKeyword("OR");
  ASSERT_NE(andBody, nullptr);
  ASSERT_NE(orBody, nullptr);
  EXPECT_EQ(andBody->kind, GrammarKind::Conditional);
  EXPECT_TRUE(hasFlag(spec, "NOT"));
  EXPECT_TRUE(hasFlag(spec, "STREQUAL"));
  EXPECT_TRUE(hasFlag(spec, "VERSION_GREATER_EQUAL"));
  EXPECT_EQ(ConditionalKeywords(), (std::vector<std::string>{"AND", "OR"}));
}

TEST(CommandRegistry, LookupIsCaseInsensitive) {
  auto reg = CommandRegistry::WithBuiltins();
  EXPECT_TRUE(reg.contains("add_library"));
  EXPECT_TRUE(reg.contains("ADD_LIBRARY"));
  EXPECT_EQ(&reg.lookup("Add_Library"), &reg.lookup("add_library"));
  EXPECT_NE(reg.lookup("add_library").findKeyword("ALIAS"), nullptr);
  EXPECT_TRUE(hasFlag(reg.lookup("add_library"), "STATIC"));
}

TEST(CommandRegistry, UnknownCommandFallsBack) {
  auto reg = CommandRegistry::WithBuiltins();
  EXPECT_FALSE(reg.contains("my_custom_thing"));
  const ArgSpec& spec = reg.lookup("my_custom_thing");
  EXPECT_EQ(spec.kind, GrammarKind::Standard);
  EXPECT_EQ(spec.npargs, NArgs::ZeroOrMore());
  EXPECT_TRUE(spec.kwargs.empty());
  EXPECT_TRUE(spec.flags.empty());
}

TEST(CommandRegistry, AddReplaces) {
  CommandRegistry reg;
  EXPECT_EQ(reg.size(), 0u);
  reg.add("Thing", Positional(NArgs::Exactly(1)));
  reg.add("THING", Positional(NArgs::Exactly(2)));
  EXPECT_EQ(reg.size(), 1u);
  EXPECT_EQ(reg.lookup("thing").npargs, NArgs::Exactly(2));
}

TEST(CommandRegistry, BuiltinTable) {
  auto reg = CommandRegistry::WithBuiltins();
  EXPECT_EQ(reg.lookup("if").kind, GrammarKind::Conditional);
  EXPECT_EQ(reg.lookup("while").kind, GrammarKind::Conditional);
  EXPECT_EQ(reg.lookup("option").npargs, NArgs::Exactly(3));
  const auto& minimum = reg.lookup("cmake_minimum_required");
  EXPECT_EQ(minimum.required, std::vector<std::string>{"VERSION"});
  const auto* cache = reg.lookup("set").findKeyword("CACHE");
  ASSERT_NE(cache, nullptr);
  EXPECT_EQ(cache->npargs, NArgs::Exactly(2));
  EXPECT_TRUE(hasFlag(*cache, "FORCE"));
  const auto* runtime = reg.lookup("install").findKeyword("RUNTIME");
  ASSERT_NE(runtime, nullptr);
  EXPECT_NE(runtime->findKeyword("NAMELINK_COMPONENT"), nullptr);
  EXPECT_TRUE(hasFlag(*runtime, "NAMELINK_SKIP"));
  EXPECT_EQ(runtime->findKeyword("DESTINATION"), nullptr);
  EXPECT_EQ(runtime->findKeyword("COMPONENT"), nullptr);
}
