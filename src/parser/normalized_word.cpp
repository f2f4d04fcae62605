/***
 * Name: cmfmt::parse::NormalizedWord / GetTag
 * Purpose: Token normalization shared by keyword dispatch and break checks.
 */
#include <cctype>
#include <string_view>

#include "cmfmt/support/case.h"
#include "parser/ArgParsers.h"

namespace cmfmt::parse {

std::optional<std::string> NormalizedWord(const lex::Token& tok) {
  if (tok.kind != lex::TokenKind::Word) { return std::nullopt; }
  return support::UpperCase(tok.text);
}

std::string GetTag(const lex::Token& tok) {
  if (tok.kind != lex::TokenKind::Comment) { return {}; }
  std::string_view body(tok.text);
  body.remove_prefix(1); // '#'
  while (!body.empty() && (body.front() == ' ' || body.front() == '\t')) { body.remove_prefix(1); }
  bool tagged = false;
  for (const std::string_view prefix : {"cmake-format:", "cmf:", "fmt:"}) {
    if (body.starts_with(prefix)) {
      body.remove_prefix(prefix.size());
      tagged = true;
      break;
    }
  }
  if (!tagged) { return {}; }
  while (!body.empty() && (body.front() == ' ' || body.front() == '\t')) { body.remove_prefix(1); }
  std::string tag;
  for (const char c : body) {
    if (std::isspace(static_cast<unsigned char>(c)) != 0) { break; }
    tag.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return tag;
}

} // namespace cmfmt::parse
