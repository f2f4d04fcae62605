/***
 * Name: cmfmt::parse::ConsumeComment / ConsumeTrailingComment
 * Purpose: Build COMMENT nodes from comment tokens.
 * Theory of Operation:
 *   A bracket comment stands alone. Line comments are glued into one block
 *   while each following line holds nothing but (indented) another comment.
 *   The newline and indentation between glued lines belong to the block.
 */
#include "lexer/TokenClass.h"
#include "parser/ArgParsers.h"

namespace cmfmt::parse {

using TK = lex::TokenKind;

cst::NodePtr ConsumeComment(TokenCursor& cursor) {
  auto node = cst::Node::Make(cst::NodeKind::Comment);
  if (cursor.peek().kind == TK::BracketComment) {
    node->append(cursor.pop());
    return node;
  }
  while (cursor.peek().kind == TK::Comment) {
    node->append(cursor.pop());
    if (cursor.peek().kind != TK::Newline) { break; }
    std::size_t ahead = 1;
    if (cursor.peek(ahead).kind == TK::Whitespace) { ++ahead; }
    if (cursor.peek(ahead).kind != TK::Comment) { break; }
    for (std::size_t i = 0; i < ahead; ++i) { node->append(cursor.pop()); }
  }
  return node;
}

void ConsumeTrailingComment(TokenCursor& cursor, cst::Node& parent) {
  std::size_t ahead = 0;
  while (cursor.peek(ahead).kind == TK::Whitespace) { ++ahead; }
  if (!lex::isComment(cursor.peek(ahead).kind)) { return; }
  for (std::size_t i = 0; i < ahead; ++i) { parent.append(cursor.pop()); }
  parent.append(ConsumeComment(cursor));
}

} // namespace cmfmt::parse
