/**
 * Name: cmfmt::lex::Lexer
 * Purpose: Tokenize a stack of listfile sources (LIFO) into one stream.
 */
#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>
#include "lexer/ITokenStream.h"
#include "lexer/InputSource.h"

namespace cmfmt::lex {

class Lexer : public ITokenStream {
public:
    Lexer() = default;

    void pushFile(const std::string& path);

    void pushString(const std::string& text, const std::string& name);

    // ITokenStream
    const Token& peek(size_t lookahead = 0) override;

    Token next() override;

    // Full stream, terminated by a single End token
    std::vector<Token> tokens();

private:
    bool finalized_{false};
    std::vector<Token> tokens_{};
    size_t pos_{0};

    struct State {
        std::unique_ptr<InputSource> src;
        std::string text;
        size_t index{0};
        int lineNo{1};
        size_t lineStart{0};
    };

    std::vector<State> stack_{}; // LIFO of inputs

    // helpers
    Token makeToken(const State& state, TokenKind kind, size_t start, size_t endExclusive) const;
    void advanceTo(State& state, size_t endExclusive) const; // track line/col across newlines
    Token scanOne(State& state); // scan a single token from current state
    size_t scanBracket(const State& state, size_t openAt) const; // end of [=*[ ... ]=*]
    size_t scanQuoted(const State& state, size_t openAt) const;
    size_t scanUnquoted(const State& state, size_t from) const;

    void buildAll(); // build tokens_ from all inputs (LIFO)
};

} // namespace cmfmt::lex
