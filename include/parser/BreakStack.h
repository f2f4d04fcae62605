/***
 * Name: cmfmt::parse::BreakStack
 * Purpose: Stack of "stop consuming" predicates for nested argument parsers.
 * Inputs:
 *   - Breaker::Keywords(words): matches a WORD whose normalized spelling is
 *     one of `words`
 *   - Breaker::Paren(): matches a right parenthesis
 * Outputs:
 *   - shouldBreak(token): true if any predicate on the stack matches
 * Theory of Operation:
 *   A stack is a value. extended() returns a new stack sharing the caller's
 *   entries plus one more, so a nested parser can never change what its
 *   caller breaks on.
 */
#pragma once

#include <cstddef>
#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "lexer/Token.h"

namespace cmfmt::parse {

class Breaker {
 public:
  enum class Kind { Keywords, Paren };

  static Breaker Keywords(const std::vector<std::string>& words);
  static Breaker Paren();

  Kind kind() const { return kind_; }
  const std::set<std::string>& words() const { return words_; }

  bool matches(const lex::Token& tok) const;

 private:
  Breaker(Kind kind, std::set<std::string> words) : kind_(kind), words_(std::move(words)) {}

  Kind kind_;
  std::set<std::string> words_;
};

class BreakStack {
 public:
  BreakStack() = default;

  BreakStack extended(Breaker breaker) const;
  bool shouldBreak(const lex::Token& tok) const;
  std::size_t size() const { return entries_.size(); }

 private:
  std::vector<std::shared_ptr<const Breaker>> entries_{};
};

} // namespace cmfmt::parse
