/***
 * Name: cmfmt::parse::TokenCursor
 * Purpose: Front-consuming view over an immutable token vector.
 * Inputs:
 *   - Token vector as produced by the lexer (optionally End-terminated)
 * Outputs:
 *   - peek()/pop() over the remaining tokens
 * Theory of Operation:
 *   All argument parsers share one cursor by mutable reference, so a token
 *   popped by a nested parser is gone for every caller. The End token is kept
 *   aside as a sentinel: peek() past the end returns it, pop() past the end
 *   throws GrammarError.
 */
#pragma once

#include <cstddef>
#include <vector>

#include "lexer/Token.h"

namespace cmfmt::parse {

class TokenCursor {
 public:
  explicit TokenCursor(std::vector<lex::Token> tokens);

  bool empty() const { return pos_ >= tokens_.size(); }
  std::size_t remaining() const { return empty() ? 0 : tokens_.size() - pos_; }
  std::size_t position() const { return pos_; }

  const lex::Token& peek(std::size_t lookahead = 0) const;
  lex::Token pop();

  const lex::Token& endToken() const { return end_; }

 private:
  std::vector<lex::Token> tokens_;
  lex::Token end_{};
  std::size_t pos_{0};
};

} // namespace cmfmt::parse
