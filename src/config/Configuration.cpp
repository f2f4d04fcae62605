/***
 * Name: cmfmt::config::Configuration (impl)
 * Purpose: Defaults, the option table and per-command resolution.
 */
#include "config/Configuration.h"

#include <algorithm>

#include "cmfmt/exceptions/config_error.h"
#include "cmfmt/support/case.h"
#include "config/ParseBool.h"

namespace cmfmt::config {

using Kind = ConfigLiteral::Kind;

const char* to_string(const LineEnding v) {
  switch (v) {
    case LineEnding::Unix: return "unix";
    case LineEnding::Windows: return "windows";
    case LineEnding::Auto: return "auto";
  }
  return "unix";
}

const char* to_string(const CommandCase v) {
  switch (v) {
    case CommandCase::Lower: return "lower";
    case CommandCase::Upper: return "upper";
    case CommandCase::Canonical: return "canonical";
    case CommandCase::Unchanged: return "unchanged";
  }
  return "canonical";
}

const char* to_string(const KeywordCase v) {
  switch (v) {
    case KeywordCase::Lower: return "lower";
    case KeywordCase::Upper: return "upper";
    case KeywordCase::Unchanged: return "unchanged";
  }
  return "unchanged";
}

namespace {

[[noreturn]] void typeMismatch(const std::string& key, const char* expected, const ConfigLiteral& value) {
  throw exceptions::ConfigError("invalid value for '" + key + "': expected " + expected + ", got " +
                                to_string(value.kind) + " " + value.render());
}

int asInt(const ConfigLiteral& v, const std::string& key) {
  if (v.kind != Kind::Int) { typeMismatch(key, "an integer", v); }
  return static_cast<int>(v.integer);
}

bool asBool(const ConfigLiteral& v, const std::string& key, diag::DiagnosticSink& sink,
            const lex::SourceLocation& where) {
  switch (v.kind) {
    case Kind::Bool: return v.boolean;
    case Kind::Int: return v.integer != 0;
    case Kind::String: return ParseBool(v.text, sink, where);
    default: typeMismatch(key, "a boolean", v);
  }
}

std::string asString(const ConfigLiteral& v, const std::string& key) {
  if (v.kind != Kind::String) { typeMismatch(key, "a string", v); }
  return v.text;
}

std::string asChar(const ConfigLiteral& v, const std::string& key) {
  const std::string s = asString(v, key);
  if (s.empty()) { typeMismatch(key, "a non-empty string", v); }
  return s.substr(0, 1);
}

std::string asChoice(const ConfigLiteral& v, const std::string& key) {
  const std::string s = asString(v, key);
  const auto* field = FindField(key);
  if (field != nullptr && std::find(field->choices.begin(), field->choices.end(), s) == field->choices.end()) {
    std::string allowed;
    for (const auto& c : field->choices) { allowed += (allowed.empty() ? "" : ", ") + c; }
    throw exceptions::ConfigError("invalid value for '" + key + "': '" + s + "' (choose from " + allowed + ")");
  }
  return s;
}

std::vector<std::string> asStringList(const ConfigLiteral& v, const std::string& key) {
  if (v.kind != Kind::List) { typeMismatch(key, "a list of strings", v); }
  std::vector<std::string> out;
  for (const auto& item : v.items) { out.push_back(asString(item, key)); }
  return out;
}

std::vector<int> asIntList(const ConfigLiteral& v, const std::string& key) {
  if (v.kind != Kind::List) { typeMismatch(key, "a list of integers", v); }
  std::vector<int> out;
  for (const auto& item : v.items) { out.push_back(asInt(item, key)); }
  return out;
}

template <typename E, std::size_t N>
E enumFromString(const std::string& s, const E (&values)[N]) {
  for (const E e : values) {
    if (s == to_string(e)) { return e; }
  }
  return values[0];
}

constexpr LineEnding kLineEndings[] = {LineEnding::Unix, LineEnding::Windows, LineEnding::Auto};
constexpr CommandCase kCommandCases[] = {CommandCase::Lower, CommandCase::Upper, CommandCase::Canonical,
                                         CommandCase::Unchanged};
constexpr KeywordCase kKeywordCases[] = {KeywordCase::Lower, KeywordCase::Upper, KeywordCase::Unchanged};

using SL = lex::SourceLocation;
using Sink = diag::DiagnosticSink;

#define CMFMT_INT_FIELD(key, member, doc)                                                              \
  FieldInfo{key, doc, {}, [](const Configuration& c) { return ConfigLiteral::Int(c.member); },        \
            [](Configuration& c, const ConfigLiteral& v, Sink&, const SL&) { c.member = asInt(v, key); }}

#define CMFMT_BOOL_FIELD(key, member, doc)                                                             \
  FieldInfo{key, doc, {}, [](const Configuration& c) { return ConfigLiteral::Bool(c.member); },       \
            [](Configuration& c, const ConfigLiteral& v, Sink& s, const SL& w) {                     \
              c.member = asBool(v, key, s, w);                                                         \
            }}

#define CMFMT_STRING_FIELD(key, member, doc)                                                           \
  FieldInfo{key, doc, {}, [](const Configuration& c) { return ConfigLiteral::String(c.member); },     \
            [](Configuration& c, const ConfigLiteral& v, Sink&, const SL&) { c.member = asString(v, key); }}

std::vector<FieldInfo> buildFields() {
  return {
      CMFMT_INT_FIELD("line_width", lineWidth, "How wide to allow formatted cmake files"),
      CMFMT_INT_FIELD("tab_size", tabSize, "How many spaces to tab for indent"),
      CMFMT_INT_FIELD("max_subargs_per_line", maxSubargsPerLine,
                      "If arglists are longer than this, break them always"),
      CMFMT_BOOL_FIELD("separate_ctrl_name_with_space", separateCtrlNameWithSpace,
                       "If true, separate flow control names from their parentheses with a space"),
      CMFMT_BOOL_FIELD("separate_fn_name_with_space", separateFnNameWithSpace,
                       "If true, separate function names from parentheses with a space"),
      CMFMT_BOOL_FIELD("dangle_parens", dangleParens,
                       "If a statement is wrapped to more than one line, than dangle the closing parenthesis on "
                       "its own line"),
      FieldInfo{"bullet_char", "What character to use for bulleted lists", {},
                [](const Configuration& c) { return ConfigLiteral::String(c.bulletChar); },
                [](Configuration& c, const ConfigLiteral& v, Sink&, const SL&) {
                  c.bulletChar = asChar(v, "bullet_char");
                }},
      FieldInfo{"enum_char", "What character to use as punctuation after numerals in an enumerated list", {},
                [](const Configuration& c) { return ConfigLiteral::String(c.enumChar); },
                [](Configuration& c, const ConfigLiteral& v, Sink&, const SL&) {
                  c.enumChar = asChar(v, "enum_char");
                }},
      FieldInfo{"line_ending", "What style line endings to use in the output.", {"windows", "unix", "auto"},
                [](const Configuration& c) { return ConfigLiteral::String(to_string(c.lineEnding)); },
                [](Configuration& c, const ConfigLiteral& v, Sink&, const SL&) {
                  c.lineEnding = enumFromString(asChoice(v, "line_ending"), kLineEndings);
                }},
      FieldInfo{"command_case", "Format command names consistently as 'lower' or 'upper' case",
                {"lower", "upper", "canonical", "unchanged"},
                [](const Configuration& c) { return ConfigLiteral::String(to_string(c.commandCase)); },
                [](Configuration& c, const ConfigLiteral& v, Sink&, const SL&) {
                  c.commandCase = enumFromString(asChoice(v, "command_case"), kCommandCases);
                }},
      FieldInfo{"keyword_case", "Format keywords consistently as 'lower' or 'upper' case",
                {"lower", "upper", "unchanged"},
                [](const Configuration& c) { return ConfigLiteral::String(to_string(c.keywordCase)); },
                [](Configuration& c, const ConfigLiteral& v, Sink&, const SL&) {
                  c.keywordCase = enumFromString(asChoice(v, "keyword_case"), kKeywordCases);
                }},
      FieldInfo{"always_wrap", "A list of command names which should always be wrapped", {},
                [](const Configuration& c) { return ConfigLiteral::StringList(c.alwaysWrap); },
                [](Configuration& c, const ConfigLiteral& v, Sink&, const SL&) {
                  c.alwaysWrap = asStringList(v, "always_wrap");
                }},
      FieldInfo{"algorithm_order",
                "Specify the order of wrapping algorithms during successive reflow attempts", {},
                [](const Configuration& c) {
                  std::vector<ConfigLiteral> items;
                  for (const int i : c.algorithmOrder) { items.push_back(ConfigLiteral::Int(i)); }
                  return ConfigLiteral::List(std::move(items));
                },
                [](Configuration& c, const ConfigLiteral& v, Sink&, const SL&) {
                  c.algorithmOrder = asIntList(v, "algorithm_order");
                }},
      CMFMT_BOOL_FIELD("autosort", autosort,
                       "If true, the argument lists which are known to be sortable will be sorted "
                       "lexicographically"),
      CMFMT_BOOL_FIELD("enable_markup", enableMarkup, "enable comment markup parsing and reflow"),
      CMFMT_BOOL_FIELD("first_comment_is_literal", firstCommentIsLiteral,
                       "If comment markup is enabled, don't reflow the first comment block in each listfile. "
                       "Use this to preserve formatting of your copyright/license statements."),
      FieldInfo{"literal_comment_pattern",
                "If comment markup is enabled, don't reflow any comment block which matches this (regex) "
                "pattern. Default is `None` (disabled).",
                {},
                [](const Configuration& c) {
                  return c.literalCommentPattern ? ConfigLiteral::String(*c.literalCommentPattern)
                                                 : ConfigLiteral::None();
                },
                [](Configuration& c, const ConfigLiteral& v, Sink&, const SL&) {
                  if (v.isNone()) {
                    c.literalCommentPattern.reset();
                  } else {
                    c.literalCommentPattern = asString(v, "literal_comment_pattern");
                  }
                }},
      CMFMT_STRING_FIELD("fence_pattern", fencePattern, "Regular expression to match preformat fences in comments"),
      CMFMT_STRING_FIELD("ruler_pattern", rulerPattern, "Regular expression to match rulers in comments"),
      CMFMT_BOOL_FIELD("emit_byteorder_mark", emitByteorderMark,
                       "If true, emit the unicode byte-order mark (BOM) at the start of the file"),
      CMFMT_INT_FIELD("hashruler_min_length", hashrulerMinLength,
                      "If a comment line starts with at least this many consecutive hash characters, then "
                      "don't lstrip() them off. This allows for lazy hash rulers where the first hash char "
                      "is not separated by space"),
      CMFMT_BOOL_FIELD("canonicalize_hashrulers", canonicalizeHashrulers,
                       "If true, then insert a space between the first hash char and remaining hash chars in a "
                       "hash ruler, and normalize its length to fill the column"),
      CMFMT_STRING_FIELD("input_encoding", inputEncoding,
                         "Specify the encoding of the input file. Defaults to utf-8."),
      CMFMT_STRING_FIELD("output_encoding", outputEncoding,
                         "Specify the encoding of the output file. Defaults to utf-8. Note that cmake only claims "
                         "to support utf-8 so be careful when using anything else"),
  };
}

#undef CMFMT_INT_FIELD
#undef CMFMT_BOOL_FIELD
#undef CMFMT_STRING_FIELD

} // namespace

const std::vector<FieldInfo>& ConfigFields() {
  static const std::vector<FieldInfo> kFields = buildFields();
  return kFields;
}

const FieldInfo* FindField(const std::string_view name) {
  for (const auto& f : ConfigFields()) {
    if (name == f.name) { return &f; }
  }
  return nullptr;
}

grammar::ArgSpec CommandSpecFromLiteral(const ConfigLiteral& decl, const std::string_view context) {
  const std::string where(context);
  if (decl.kind == Kind::Int || decl.kind == Kind::String) {
    const auto npargs = decl.kind == Kind::Int ? std::optional<grammar::NArgs>(grammar::NArgs::Exactly(
                                                     static_cast<int>(decl.integer)))
                                               : grammar::NArgs::parse(decl.text);
    if (!npargs || (decl.kind == Kind::Int && decl.integer < 0)) { typeMismatch(where, "an arity", decl); }
    return grammar::Positional(*npargs);
  }
  if (decl.kind != Kind::Dict) { typeMismatch(where, "a dict or an arity", decl); }

  grammar::ArgSpec spec = grammar::Standard(grammar::NArgs::ZeroOrMore());
  for (const auto& [key, value] : decl.entries) {
    if (key == "npargs" || key == "pargs") {
      spec.npargs = CommandSpecFromLiteral(value, where + "." + key).npargs;
    } else if (key == "flags") {
      for (const auto& flag : asStringList(value, where + ".flags")) { grammar::AddFlag(spec, flag); }
    } else if (key == "kwargs") {
      if (value.kind != Kind::Dict) { typeMismatch(where + ".kwargs", "a dict", value); }
      for (const auto& [kw, body] : value.entries) {
        grammar::AddKeyword(spec, kw, CommandSpecFromLiteral(body, where + ".kwargs." + kw));
      }
    } else if (key == "required") {
      for (const auto& kw : asStringList(value, where + ".required")) {
        spec.required.push_back(support::UpperCase(kw));
      }
    } else if (key == "sortable") {
      if (value.kind != Kind::Bool) { typeMismatch(where + ".sortable", "a boolean", value); }
      spec.sortable = value.boolean;
    } else {
      throw exceptions::ConfigError("unknown command attribute '" + key + "' in " + where);
    }
  }
  return spec;
}

ConfigLiteral CommandSpecToLiteral(const grammar::ArgSpec& spec) {
  const auto arity = [](const grammar::NArgs& n) {
    return n.isExact() ? ConfigLiteral::Int(n.count) : ConfigLiteral::String(n.str());
  };
  if (spec.kind == grammar::GrammarKind::Positional && spec.flags.empty() && !spec.sortable) {
    return arity(spec.npargs);
  }
  ConfigLiteral out;
  out.kind = Kind::Dict;
  out.entries.emplace_back("npargs", arity(spec.npargs));
  if (!spec.flags.empty()) { out.entries.emplace_back("flags", ConfigLiteral::StringList(spec.flags)); }
  if (!spec.kwargs.empty()) {
    ConfigLiteral kwargs;
    kwargs.kind = Kind::Dict;
    for (const auto& [kw, body] : spec.kwargs) { kwargs.entries.emplace_back(kw, CommandSpecToLiteral(*body)); }
    out.entries.emplace_back("kwargs", std::move(kwargs));
  }
  if (!spec.required.empty()) { out.entries.emplace_back("required", ConfigLiteral::StringList(spec.required)); }
  if (spec.sortable) { out.entries.emplace_back("sortable", ConfigLiteral::Bool(true)); }
  return out;
}

Configuration::Configuration() {
  additionalCommands.emplace(
      "foo", grammar::Standard(grammar::NArgs::ZeroOrMore(),
                               {{"HEADERS", grammar::Positional(grammar::NArgs::ZeroOrMore())},
                                {"SOURCES", grammar::Positional(grammar::NArgs::ZeroOrMore())},
                                {"DEPENDS", grammar::Positional(grammar::NArgs::ZeroOrMore())}},
                               {"BAR", "BAZ"}));
}

const std::string& Configuration::endl() const {
  static const std::string kUnix{"\n"};
  static const std::string kWindows{"\r\n"};
  return detected_.value_or(lineEnding) == LineEnding::Windows ? kWindows : kUnix;
}

void Configuration::setLineEnding(const LineEnding detected) {
  if (detected == LineEnding::Auto) {
    throw exceptions::ConfigError("detected line ending must be 'unix' or 'windows'");
  }
  detected_ = detected;
}

ConfigLiteral Configuration::get(const std::string_view key) const {
  if (key == "additional_commands") {
    ConfigLiteral out;
    out.kind = Kind::Dict;
    for (const auto& [name, spec] : additionalCommands) { out.entries.emplace_back(name, CommandSpecToLiteral(spec)); }
    return out;
  }
  if (key == "per_command") {
    ConfigLiteral out;
    out.kind = Kind::Dict;
    for (const auto& [name, overrides] : perCommand) {
      ConfigLiteral inner;
      inner.kind = Kind::Dict;
      for (const auto& [k, v] : overrides) { inner.entries.emplace_back(k, v); }
      out.entries.emplace_back(name, std::move(inner));
    }
    return out;
  }
  const auto* field = FindField(key);
  if (field == nullptr) {
    throw exceptions::ConfigError("unknown configuration key '" + std::string(key) + "'");
  }
  return field->get(*this);
}

void Configuration::set(const std::string_view key, const ConfigLiteral& value, diag::DiagnosticSink& sink,
                        const lex::SourceLocation& where) {
  if (key == "additional_commands") {
    if (value.kind != Kind::Dict) { typeMismatch(std::string(key), "a dict", value); }
    additionalCommands.clear();
    for (const auto& [name, decl] : value.entries) { declareCommand(name, decl); }
    return;
  }
  if (key == "per_command") {
    if (value.kind != Kind::Dict) { typeMismatch(std::string(key), "a dict", value); }
    for (const auto& [name, overrides] : value.entries) {
      if (overrides.kind != Kind::Dict) {
        sink.warn("Invalid override of type " + std::string(to_string(overrides.kind)) + " for " + name, where);
        continue;
      }
      for (const auto& [k, v] : overrides.entries) { overrideCommand(name, k, v, sink, where); }
    }
    return;
  }
  const auto* field = FindField(key);
  if (field == nullptr) {
    throw exceptions::ConfigError("unknown configuration key '" + std::string(key) + "'");
  }
  field->set(*this, value, sink, where);
}

ConfigLiteral Configuration::resolveForCommand(const std::string_view command, const std::string_view key) const {
  const auto cmd = perCommand.find(support::FoldCase(command));
  if (cmd != perCommand.end()) {
    const auto it = cmd->second.find(std::string(key));
    if (it != cmd->second.end()) { return it->second; }
  }
  return get(key);
}

void Configuration::declareCommand(const std::string_view name, const ConfigLiteral& decl) {
  const std::string folded = support::FoldCase(name);
  additionalCommands.insert_or_assign(folded, CommandSpecFromLiteral(decl, "additional_commands." + folded));
}

void Configuration::overrideCommand(const std::string_view name, const std::string_view key,
                                    const ConfigLiteral& value, diag::DiagnosticSink& sink,
                                    const lex::SourceLocation& where) {
  const auto* field = FindField(key);
  if (field == nullptr) {
    sink.warn("unknown per-command configuration key '" + std::string(key) + "' for " + std::string(name), where);
    return;
  }
  Configuration scratch;
  field->set(scratch, value, sink, where);
  perCommand[support::FoldCase(name)][std::string(key)] = field->get(scratch);
}

} // namespace cmfmt::config
