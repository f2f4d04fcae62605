/**
 * Name: cmfmt::lex::TokenKind
 * Purpose: Token kinds produced by the listfile lexer.
 */
#pragma once

namespace cmfmt::lex {

enum class TokenKind {
    End, // end of input (sentinel, empty spelling)

    Word, // identifier-like bare word: add_library, PUBLIC
    Number, // 12, -3, 1.5
    Deref, // ${VAR}
    AtWord, // @VAR@
    UnquotedLiteral, // any other unquoted argument
    QuotedLiteral, // "..."
    BracketArgument, // [[...]] / [==[...]==]

    LeftParen, // (
    RightParen, // )

    Whitespace, // spaces and tabs
    Newline, // \n or \r\n
    Comment, // # ... to end of line
    BracketComment, // #[[...]]

    FormatOff, // # cmake-format: off
    FormatOn, // # cmake-format: on
    ByteOrderMark // UTF-8 BOM at offset 0
};

// Convert TokenKind to a stable string for diagnostics/logging
const char* to_string(TokenKind k);

} // namespace cmfmt::lex
