/**
 * Name: cmfmt::lex::ITokenStream
 * Purpose: Pull interface the parser reads listfile tokens through.
 * Contract:
 *   - The stream ends with exactly one End token; peeking or pulling past it
 *     keeps returning End.
 *   - Whitespace, newlines and comments are delivered, never skipped.
 */
#pragma once

#include <cstddef>
#include "lexer/Token.h"

namespace cmfmt::lex {

class ITokenStream {
public:
    virtual ~ITokenStream() = default;

    // k-th unconsumed token (0 = front)
    virtual const Token& peek(std::size_t k = 0) = 0;
    // Remove and return the front token
    virtual Token next() = 0;
};

} // namespace cmfmt::lex
