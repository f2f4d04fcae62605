/***
 * Name: cmfmt::grammar::ArgSpec (impl)
 * Purpose: Descriptor builders and keyword table queries.
 */
#include "grammar/ArgSpec.h"

#include <algorithm>

#include "cmfmt/support/case.h"
#include "grammar/ConditionalFlags.h"

namespace cmfmt::grammar {

const char* to_string(const GrammarKind kind) {
  switch (kind) {
    case GrammarKind::Standard:
      return "standard";
    case GrammarKind::Positional:
      return "positional";
    case GrammarKind::Conditional:
      return "conditional";
  }
  return "standard";
}

const ArgSpec* ArgSpec::findKeyword(const std::string_view normalized) const {
  const auto it = kwargs.find(std::string(normalized));
  return it == kwargs.end() ? nullptr : it->second.get();
}

std::vector<std::string> ArgSpec::keywordNames() const {
  std::vector<std::string> names;
  names.reserve(kwargs.size());
  for (const auto& entry : kwargs) { names.push_back(entry.first); }
  return names;
}

void AddKeyword(ArgSpec& spec, const std::string_view keyword, ArgSpec body) {
  spec.kwargs[support::UpperCase(keyword)] = std::make_shared<const ArgSpec>(std::move(body));
}

void AddFlag(ArgSpec& spec, const std::string_view flag) {
  auto norm = support::UpperCase(flag);
  if (std::find(spec.flags.begin(), spec.flags.end(), norm) == spec.flags.end()) {
    spec.flags.push_back(std::move(norm));
  }
}

ArgSpec& Require(ArgSpec& spec, const std::initializer_list<std::string> keywords) {
  for (const auto& kw : keywords) {
    spec.required.push_back(support::UpperCase(kw));
  }
  return spec;
}

ArgSpec Standard(const NArgs npargs, const std::initializer_list<KeywordEntry> kwargs,
                 const std::initializer_list<std::string> flags) {
  ArgSpec spec;
  spec.kind = GrammarKind::Standard;
  spec.npargs = npargs;
  for (const auto& [name, body] : kwargs) {
    AddKeyword(spec, name, body);
  }
  for (const auto& flag : flags) {
    AddFlag(spec, flag);
  }
  return spec;
}

ArgSpec Positional(const NArgs npargs, const std::initializer_list<std::string> flags, const bool sortable) {
  ArgSpec spec;
  spec.kind = GrammarKind::Positional;
  spec.npargs = npargs;
  spec.sortable = sortable;
  for (const auto& flag : flags) {
    AddFlag(spec, flag);
  }
  return spec;
}

ArgSpec Conditional() {
  ArgSpec spec;
  spec.kind = GrammarKind::Conditional;
  spec.npargs = NArgs::OneOrMore();
  spec.flags = ConditionalFlags();
  for (const auto& kw : ConditionalKeywords()) {
    ArgSpec nested;
    nested.kind = GrammarKind::Conditional;
    nested.npargs = NArgs::OneOrMore();
    nested.flags = ConditionalFlags();
    spec.kwargs[kw] = std::make_shared<const ArgSpec>(std::move(nested));
  }
  return spec;
}

} // namespace cmfmt::grammar
