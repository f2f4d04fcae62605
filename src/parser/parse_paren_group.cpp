/***
 * Name: cmfmt::parse::ParseParenGroup
 * Purpose: Parse `( conditional... )` into a PARENGROUP.
 * Theory of Operation:
 *   The contents are parsed as a conditional group under a fresh breakstack
 *   holding only the right-paren breaker; enclosing keywords do not leak in.
 *   A missing ')' is reported at the offending token (or end of input).
 */
#include "cmfmt/exceptions/grammar_error.h"
#include "cmfmt/exceptions/parse_error.h"
#include "parser/ArgParsers.h"

namespace cmfmt::parse {

using TK = lex::TokenKind;

cst::NodePtr ParseParenGroup(TokenCursor& cursor) {
  const lex::Token& open = cursor.peek();
  if (open.kind != TK::LeftParen) {
    throw exceptions::GrammarError("paren group must start at '('", open.location(), open.text, "(");
  }

  auto tree = cst::Node::Make(cst::NodeKind::ParenGroup);
  auto lparen = cst::Node::Make(cst::NodeKind::LParen);
  lparen->append(cursor.pop());
  tree->append(std::move(lparen));

  tree->append(ParseConditionalGroup(cursor, BreakStack{}.extended(Breaker::Paren())));

  const lex::Token& close = cursor.peek();
  if (cursor.empty() || close.kind != TK::RightParen) {
    const std::string observed = cursor.empty() ? std::string("end of input")
                                                : std::string(lex::to_string(close.kind)) + " '" + close.text + "'";
    throw exceptions::ParseError("unexpected token in parenthetical group", close.location(), observed,
                                 lex::to_string(TK::RightParen));
  }
  auto rparen = cst::Node::Make(cst::NodeKind::RParen);
  rparen->append(cursor.pop());
  tree->append(std::move(rparen));

  ConsumeTrailingComment(cursor, *tree);
  return tree;
}

} // namespace cmfmt::parse
