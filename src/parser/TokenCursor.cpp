/***
 * Name: cmfmt::parse::TokenCursor (impl)
 */
#include "parser/TokenCursor.h"

#include <utility>

#include "cmfmt/exceptions/grammar_error.h"

namespace cmfmt::parse {

TokenCursor::TokenCursor(std::vector<lex::Token> tokens) : tokens_(std::move(tokens)) {
  if (!tokens_.empty() && tokens_.back().kind == lex::TokenKind::End) {
    end_ = tokens_.back();
    tokens_.pop_back();
  } else if (!tokens_.empty()) {
    const auto& last = tokens_.back();
    end_.file = last.file;
    end_.line = last.line;
    end_.col = last.col + static_cast<int>(last.text.size());
    end_.offset = last.offset + last.text.size();
  }
}

const lex::Token& TokenCursor::peek(const std::size_t lookahead) const {
  const std::size_t idx = pos_ + lookahead;
  return idx < tokens_.size() ? tokens_[idx] : end_;
}

lex::Token TokenCursor::pop() {
  if (empty()) {
    throw exceptions::GrammarError("token stream exhausted", end_.location(), "end of input", "token");
  }
  return tokens_[pos_++];
}

} // namespace cmfmt::parse
