/**
 * Name: cmfmt::lex::TokenKind helpers
 * Purpose: Implementation for TokenKind utilities.
 */
#include "lexer/TokenKind.h"

namespace cmfmt::lex {
    const char *to_string(const TokenKind k) {
        using enum cmfmt::lex::TokenKind;
        switch (k) {
            case End: return "End";
            case Word: return "Word";
            case Number: return "Number";
            case Deref: return "Deref";
            case AtWord: return "AtWord";
            case UnquotedLiteral: return "UnquotedLiteral";
            case QuotedLiteral: return "QuotedLiteral";
            case BracketArgument: return "BracketArgument";
            case LeftParen: return "LeftParen";
            case RightParen: return "RightParen";
            case Whitespace: return "Whitespace";
            case Newline: return "Newline";
            case Comment: return "Comment";
            case BracketComment: return "BracketComment";
            case FormatOff: return "FormatOff";
            case FormatOn: return "FormatOn";
            case ByteOrderMark: return "ByteOrderMark";
        }
        return "Unknown";
    }
} // namespace cmfmt::lex
