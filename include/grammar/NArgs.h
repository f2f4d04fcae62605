/***
 * Name: cmfmt::grammar::NArgs
 * Purpose: Positional arity of a group: an exact count or one of ?, *, +.
 * Theory of Operation:
 *   isFull() answers "has this group consumed enough?" and is the only place
 *   the parser interprets arity. Only Exact and ZeroOrOne ever become full;
 *   * and + consume until something breaks them.
 */
#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace cmfmt::grammar {

struct NArgs {
  enum class Kind { Exact, ZeroOrOne, ZeroOrMore, OneOrMore };

  Kind kind{Kind::ZeroOrMore};
  int count{0}; // meaningful for Exact only

  static NArgs Exactly(int n) { return NArgs{Kind::Exact, n}; }
  static NArgs ZeroOrOne() { return NArgs{Kind::ZeroOrOne, 0}; }
  static NArgs ZeroOrMore() { return NArgs{Kind::ZeroOrMore, 0}; }
  static NArgs OneOrMore() { return NArgs{Kind::OneOrMore, 0}; }

  bool isExact() const { return kind == Kind::Exact; }
  bool isFull(int consumed) const;

  // "*", "+", "?" or the decimal count
  std::string str() const;

  static std::optional<NArgs> parse(std::string_view text);

  bool operator==(const NArgs& other) const = default;
};

} // namespace cmfmt::grammar
