/***
 * Name: cmfmt::grammar::ArgSpec
 * Purpose: Data-only grammar descriptor for a command or keyword body.
 * Inputs:
 *   - kind: which generic parser interprets the descriptor
 *   - npargs/flags: positional arity and zero-width flag words
 *   - kwargs: normalized keyword -> nested descriptor (recursive)
 *   - required: keywords a lint pass expects to find
 * Theory of Operation:
 *   Descriptors are immutable once registered; nested descriptors are shared
 *   through shared_ptr<const ArgSpec> so copies of a command table are cheap.
 *   parse::ParseGrammar() is the single interpreter.
 */
#pragma once

#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "grammar/NArgs.h"
#include "grammar/PositionalSpec.h"

namespace cmfmt::grammar {

enum class GrammarKind { Standard, Positional, Conditional };

const char* to_string(GrammarKind kind);

struct ArgSpec;
using ArgSpecPtr = std::shared_ptr<const ArgSpec>;

struct ArgSpec {
  GrammarKind kind{GrammarKind::Standard};
  NArgs npargs{};
  std::map<std::string, ArgSpecPtr> kwargs{};
  std::vector<std::string> flags{};
  bool sortable{false};
  std::vector<std::string> required{};

  // nullptr if `normalized` is not a keyword of this grammar
  const ArgSpec* findKeyword(std::string_view normalized) const;
  std::vector<std::string> keywordNames() const;
  PositionalSpec positional() const { return PositionalSpec{npargs, flags}; }
};

using KeywordEntry = std::pair<std::string, ArgSpec>;

// Builders. Keyword and flag spellings are normalized here.
ArgSpec Standard(NArgs npargs, std::initializer_list<KeywordEntry> kwargs = {},
                 std::initializer_list<std::string> flags = {});
ArgSpec Positional(NArgs npargs, std::initializer_list<std::string> flags = {}, bool sortable = false);
ArgSpec Conditional();

// Keyword tables assembled at runtime (config overrides)
void AddKeyword(ArgSpec& spec, std::string_view keyword, ArgSpec body);
void AddFlag(ArgSpec& spec, std::string_view flag);
ArgSpec& Require(ArgSpec& spec, std::initializer_list<std::string> keywords);

} // namespace cmfmt::grammar
