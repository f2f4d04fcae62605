/**
 * Name: cmfmt::lex::SourceLocation
 * Purpose: File position of a token (1-based line/column, 0-based byte offset).
 */
#pragma once

#include <cstddef>
#include <string>

namespace cmfmt::lex {

struct SourceLocation {
    std::string file{};
    int line{0};
    int col{0};
    std::size_t offset{0};
};

} // namespace cmfmt::lex
