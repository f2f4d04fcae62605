/**
 * Name: cmfmt::lex token classes
 * Purpose: Predicates grouping token kinds the parser treats alike.
 */
#pragma once

#include "lexer/TokenKind.h"

namespace cmfmt::lex {

inline bool isWhitespace(const TokenKind k) { return k == TokenKind::Whitespace || k == TokenKind::Newline; }

inline bool isComment(const TokenKind k) { return k == TokenKind::Comment || k == TokenKind::BracketComment; }

// Tokens that carry meaning for the listfile (everything but layout and comments)
inline bool isSemantic(const TokenKind k) {
    return !isWhitespace(k) && !isComment(k) && k != TokenKind::End && k != TokenKind::ByteOrderMark;
}

} // namespace cmfmt::lex
