/***
 * Name: cmfmt::lex::Lexer
 * Purpose: Tokenize listfile source(s) into a single lossless token stream.
 * Theory of Operation:
 *   Each source is read whole and scanned left to right. Every byte of the input
 *   lands in exactly one token, so concatenating token spellings reproduces the
 *   source. Whitespace, newlines and comments are tokens like any other.
 */
#include "lexer/Lexer.h"
#include "cmfmt/exceptions/file_read_error.h"
#include "cmfmt/exceptions/parse_error.h"
#include "cmfmt/support/fs.h"
#include <cctype>
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cmfmt::lex {

static bool isIdentStart(char chr) { return (std::isalpha(static_cast<unsigned char>(chr)) != 0) || chr == '_'; }
static bool isIdentChar(char chr) { return (std::isalnum(static_cast<unsigned char>(chr)) != 0) || chr == '_'; }
static bool isBlank(char chr) { return chr == ' ' || chr == '\t' || chr == '\f' || chr == '\v'; }

// FileInput implementation
FileInput::FileInput(std::string path) : path_(std::move(path)) {}

bool FileInput::read(std::string& out) {
  std::string err;
  return support::ReadFile(path_, out, err);
}

// StringInput implementation
StringInput::StringInput(std::string text, std::string name)
  : name_(std::move(name)), text_(std::move(text)) {}

bool StringInput::read(std::string& out) {
  out = text_;
  return true;
}


void Lexer::pushFile(const std::string& path) {
  State state;
  state.src = std::make_unique<FileInput>(path);
  stack_.push_back(std::move(state));
}


void Lexer::pushString(const std::string& text, const std::string& name) {
  State state;
  state.src = std::make_unique<StringInput>(text, name);
  stack_.push_back(std::move(state));
}

Token Lexer::makeToken(const State& state, const TokenKind kind, const size_t start, const size_t endExclusive) const {
  Token tok;
  tok.kind = kind;
  tok.text = state.text.substr(start, endExclusive - start);
  tok.file = state.src->name();
  tok.line = state.lineNo;
  tok.col = static_cast<int>(start - state.lineStart + 1);
  tok.offset = start;
  return tok;
}

void Lexer::advanceTo(State& state, const size_t endExclusive) const {
  for (size_t i = state.index; i < endExclusive; ++i) {
    if (state.text[i] == '\n') {
      ++state.lineNo;
      state.lineStart = i + 1;
    }
  }
  state.index = endExclusive;
}

// Returns the index one past the closing bracket, or npos if `openAt` does not
// start a bracket opener `[=*[`. Throws on an unterminated bracket.
size_t Lexer::scanBracket(const State& state, const size_t openAt) const {
  const std::string& text = state.text;
  if (openAt >= text.size() || text[openAt] != '[') { return std::string::npos; }
  size_t pos = openAt + 1;
  size_t level = 0;
  while (pos < text.size() && text[pos] == '=') { ++level; ++pos; }
  if (pos >= text.size() || text[pos] != '[') { return std::string::npos; }
  std::string closer = "]";
  closer.append(level, '=');
  closer += "]";
  const size_t close = text.find(closer, pos + 1);
  if (close == std::string::npos) {
    Token at = makeToken(state, TokenKind::BracketArgument, openAt, pos + 1);
    throw exceptions::ParseError("unterminated bracket", at.location(), "end-of-stream", closer);
  }
  return close + closer.size();
}

size_t Lexer::scanQuoted(const State& state, const size_t openAt) const {
  const std::string& text = state.text;
  size_t pos = openAt + 1;
  while (pos < text.size()) {
    const char c = text[pos];
    if (c == '\\') { pos += 2; continue; }
    if (c == '"') { return pos + 1; }
    ++pos;
  }
  Token at = makeToken(state, TokenKind::QuotedLiteral, openAt, openAt + 1);
  throw exceptions::ParseError("unterminated quoted argument", at.location(), "end-of-stream", "'\"'");
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
size_t Lexer::scanUnquoted(const State& state, const size_t from) const {
  const std::string& text = state.text;
  size_t pos = from;
  int derefDepth = 0;
  while (pos < text.size()) {
    const char c = text[pos];
    if (isBlank(c) || c == '\r' || c == '\n') { break; }
    if (c == '(' || c == ')' || c == '#') {
      if (derefDepth == 0) { break; }
    }
    if (c == '\\') { pos = (pos + 2 <= text.size()) ? pos + 2 : text.size(); continue; }
    if (c == '$' && pos + 1 < text.size() && text[pos + 1] == '{') { ++derefDepth; pos += 2; continue; }
    if (c == '}' && derefDepth > 0) { --derefDepth; ++pos; continue; }
    // Legacy unquoted arguments may embed quoted sections: -DFOO="a b"
    if (c == '"') {
      if (pos == from) { break; }
      pos = scanQuoted(state, pos);
      continue;
    }
    ++pos;
  }
  return pos;
}

static bool isWordSpelling(std::string_view text) {
  if (text.empty() || !isIdentStart(text[0])) { return false; }
  for (const char c : text) { if (!isIdentChar(c)) { return false; } }
  return true;
}

static bool isNumberSpelling(std::string_view text) {
  size_t pos = 0;
  if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) { ++pos; }
  const size_t intStart = pos;
  while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos])) != 0) { ++pos; }
  if (pos == intStart) { return false; }
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    const size_t fracStart = pos;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos])) != 0) { ++pos; }
    if (pos == fracStart) { return false; }
  }
  return pos == text.size();
}

// ${...} whose first opener closes at the final character
static bool isDerefSpelling(std::string_view text) {
  if (text.size() < 3 || text[0] != '$' || text[1] != '{') { return false; }
  int depth = 0;
  for (size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '{') { ++depth; }
    else if (text[i] == '}') {
      --depth;
      if (depth == 0) { return i + 1 == text.size(); }
    }
  }
  return false;
}

static bool isAtWordSpelling(std::string_view text) {
  if (text.size() < 3 || text.front() != '@' || text.back() != '@') { return false; }
  return isWordSpelling(text.substr(1, text.size() - 2));
}

static TokenKind classifyUnquoted(std::string_view text) {
  if (isWordSpelling(text)) { return TokenKind::Word; }
  if (isNumberSpelling(text)) { return TokenKind::Number; }
  if (isDerefSpelling(text)) { return TokenKind::Deref; }
  if (isAtWordSpelling(text)) { return TokenKind::AtWord; }
  return TokenKind::UnquotedLiteral;
}

// `# cmake-format: off`, `# cmf: on`, `# fmt: off` style switches
static TokenKind classifyComment(std::string_view text) {
  size_t pos = 1;
  while (pos < text.size() && isBlank(text[pos])) { ++pos; }
  std::string_view rest = text.substr(pos);
  for (const std::string_view prefix : {std::string_view{"cmake-format:"}, std::string_view{"cmf:"}, std::string_view{"fmt:"}}) {
    if (rest.substr(0, prefix.size()) != prefix) { continue; }
    std::string_view value = rest.substr(prefix.size());
    while (!value.empty() && isBlank(value.front())) { value.remove_prefix(1); }
    while (!value.empty() && isBlank(value.back())) { value.remove_suffix(1); }
    if (value == "off") { return TokenKind::FormatOff; }
    if (value == "on") { return TokenKind::FormatOn; }
  }
  return TokenKind::Comment;
}

// NOLINTNEXTLINE(readability-function-size,readability-function-cognitive-complexity)
Token Lexer::scanOne(State& state) {
  const std::string& text = state.text;
  const size_t idx = state.index;
  const char chr = text[idx];

  auto emit = [&](TokenKind kind, size_t endExclusive) {
    Token tok = makeToken(state, kind, idx, endExclusive);
    advanceTo(state, endExclusive);
    return tok;
  };

  if (idx == 0 && text.compare(0, 3, "\xEF\xBB\xBF") == 0) { return emit(TokenKind::ByteOrderMark, 3); }
  if (chr == '\n') { return emit(TokenKind::Newline, idx + 1); }
  if (chr == '\r' && idx + 1 < text.size() && text[idx + 1] == '\n') { return emit(TokenKind::Newline, idx + 2); }
  if (isBlank(chr) || chr == '\r') {
    size_t end = idx + 1;
    while (end < text.size() && (isBlank(text[end]) || (text[end] == '\r' && (end + 1 >= text.size() || text[end + 1] != '\n')))) { ++end; }
    return emit(TokenKind::Whitespace, end);
  }
  if (chr == '#') {
    const size_t bracketEnd = scanBracket(state, idx + 1);
    if (bracketEnd != std::string::npos) { return emit(TokenKind::BracketComment, bracketEnd); }
    size_t end = idx + 1;
    while (end < text.size() && text[end] != '\n' && !(text[end] == '\r' && end + 1 < text.size() && text[end + 1] == '\n')) { ++end; }
    return emit(classifyComment(std::string_view(text).substr(idx, end - idx)), end);
  }
  if (chr == '(') { return emit(TokenKind::LeftParen, idx + 1); }
  if (chr == ')') { return emit(TokenKind::RightParen, idx + 1); }
  if (chr == '[') {
    const size_t bracketEnd = scanBracket(state, idx);
    if (bracketEnd != std::string::npos) { return emit(TokenKind::BracketArgument, bracketEnd); }
  }
  if (chr == '"') { return emit(TokenKind::QuotedLiteral, scanQuoted(state, idx)); }

  const size_t end = scanUnquoted(state, idx);
  return emit(classifyUnquoted(std::string_view(text).substr(idx, end - idx)), end);
}

void Lexer::buildAll() {
  if (finalized_) { return; }
  finalized_ = true;
  Token eof;
  eof.kind = TokenKind::End;
  // Process stack in LIFO order
  while (!stack_.empty()) {
    State state = std::move(stack_.back());
    stack_.pop_back();
    if (!state.src->read(state.text)) {
      throw exceptions::FileReadError("failed to read listfile: " + state.src->name());
    }
    state.index = 0; state.lineNo = 1; state.lineStart = 0;
    while (state.index < state.text.size()) {
      tokens_.push_back(scanOne(state));
    }
    eof.file = state.src->name();
    eof.line = state.lineNo;
    eof.col = static_cast<int>(state.index - state.lineStart + 1);
    eof.offset = state.index;
  }
  tokens_.push_back(eof);
}

const Token& Lexer::peek(size_t lookahead) {
  if (!finalized_) { buildAll(); }
  if (pos_ + lookahead < tokens_.size()) {
    return tokens_[pos_ + lookahead];
  }
  return tokens_.back();
}

Token Lexer::next() {
  if (!finalized_) { buildAll(); }
  if (pos_ < tokens_.size()) {
    return tokens_[pos_++];
  }
  return tokens_.back();
}

std::vector<Token> Lexer::tokens() {
  if (!finalized_) { buildAll(); }
  return tokens_;
}

} // namespace cmfmt::lex
