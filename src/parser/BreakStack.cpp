/***
 * Name: cmfmt::parse::BreakStack (impl)
 */
#include "parser/BreakStack.h"

#include "parser/ArgParsers.h"

namespace cmfmt::parse {

Breaker Breaker::Keywords(const std::vector<std::string>& words) {
  return Breaker(Kind::Keywords, std::set<std::string>(words.begin(), words.end()));
}

Breaker Breaker::Paren() { return Breaker(Kind::Paren, {}); }

bool Breaker::matches(const lex::Token& tok) const {
  if (kind_ == Kind::Paren) {
    return tok.kind == lex::TokenKind::RightParen;
  }
  const auto word = NormalizedWord(tok);
  return word && words_.contains(*word);
}

BreakStack BreakStack::extended(Breaker breaker) const {
  BreakStack out = *this;
  out.entries_.push_back(std::make_shared<const Breaker>(std::move(breaker)));
  return out;
}

bool BreakStack::shouldBreak(const lex::Token& tok) const {
  for (const auto& entry : entries_) {
    if (entry->matches(tok)) { return true; }
  }
  return false;
}

} // namespace cmfmt::parse
