/**
 * Name: cmfmt::lex::Token
 * Purpose: Token structure with source location and exact spelling.
 */
#pragma once

#include <cstddef>
#include <string>
#include "lexer/SourceLocation.h"
#include "lexer/TokenKind.h"

namespace cmfmt::lex {

struct Token {
    TokenKind kind{TokenKind::End};
    std::string text{}; // exact source spelling
    std::string file{};
    int line{1}; // 1-based line number
    int col{1}; // 1-based column at token start
    std::size_t offset{0}; // byte offset of the first character

    SourceLocation location() const { return SourceLocation{file, line, col, offset}; }
};

} // namespace cmfmt::lex
