/***
 * Name: cmfmt::parse::Parser (impl)
 * Purpose: File-level structure: statements, comments, switches and blocks.
 */
#include "parser/Parser.h"

#include <map>
#include <utility>

#include "cmfmt/exceptions/parse_error.h"
#include "cmfmt/support/case.h"
#include "lexer/TokenClass.h"
#include "parser/ArgParsers.h"

namespace cmfmt::parse {

using TK = lex::TokenKind;

namespace {

std::string describe(const TokenCursor& cursor) {
  if (cursor.empty()) { return "end of input"; }
  const auto& tok = cursor.peek();
  return std::string(lex::to_string(tok.kind)) + " '" + tok.text + "'";
}

} // namespace

std::string Parser::blockCloser(const std::string& command) {
  static const std::map<std::string, std::string> kClosers{
      {"if", "endif"},         {"foreach", "endforeach"}, {"while", "endwhile"},
      {"function", "endfunction"}, {"macro", "endmacro"},   {"block", "endblock"}};
  const auto it = kClosers.find(command);
  return it == kClosers.end() ? std::string() : it->second;
}

std::vector<lex::Token> Parser::drain(lex::ITokenStream& stream) {
  std::vector<lex::Token> out;
  for (;;) {
    auto t = stream.next();
    const bool done = t.kind == TK::End;
    out.push_back(std::move(t));
    if (done) { break; }
  }
  return out;
}

cst::NodePtr Parser::parseFile() {
  TokenCursor cursor(drain(ts_));
  return parseBody(cursor, std::string());
}

std::string Parser::peekCommand(const TokenCursor& cursor) {
  const auto& tok = cursor.peek();
  return tok.kind == TK::Word ? support::FoldCase(tok.text) : std::string();
}

cst::NodePtr Parser::parseBody(TokenCursor& cursor, const std::string& closer) {
  auto body = cst::Node::Make(cst::NodeKind::Body);
  while (!cursor.empty()) {
    const lex::Token& tok = cursor.peek();
    if (lex::isWhitespace(tok.kind) || tok.kind == TK::ByteOrderMark) {
      body->append(cursor.pop());
      continue;
    }
    if (lex::isComment(tok.kind)) {
      body->append(ConsumeComment(cursor));
      continue;
    }
    if (tok.kind == TK::FormatOff || tok.kind == TK::FormatOn) {
      auto node = cst::Node::Make(cst::NodeKind::OnOffSwitch);
      node->append(cursor.pop());
      body->append(std::move(node));
      continue;
    }
    if (tok.kind != TK::Word) {
      throw exceptions::ParseError("unexpected token at statement level", tok.location(), describe(cursor),
                                   "command name");
    }
    if (!closer.empty() && peekCommand(cursor) == closer) {
      return body;
    }
    auto statement = parseStatement(cursor);
    const std::string nestedCloser = blockCloser(statement->command());
    if (nestedCloser.empty()) {
      body->append(std::move(statement));
    } else {
      body->append(parseFlowControl(cursor, std::move(statement), nestedCloser));
    }
  }
  if (!closer.empty()) {
    throw exceptions::ParseError("unterminated block", cursor.endToken().location(), "end of input",
                                 closer + "()");
  }
  return body;
}

cst::NodePtr Parser::parseFlowControl(TokenCursor& cursor, cst::NodePtr opener, const std::string& closer) {
  auto block = cst::Node::Make(cst::NodeKind::FlowControl);
  block->append(std::move(opener));
  block->append(parseBody(cursor, closer));
  block->append(parseStatement(cursor));
  return block;
}

cst::NodePtr Parser::parseStatement(TokenCursor& cursor) {
  auto statement = cst::Node::Make(cst::NodeKind::Statement);
  const lex::Token name = cursor.pop();
  const std::string command = support::FoldCase(name.text);
  auto funName = cst::Node::Make(cst::NodeKind::FunName);
  funName->append(name);
  statement->append(std::move(funName));

  while (cursor.peek().kind == TK::Whitespace) {
    statement->append(cursor.pop());
  }
  if (cursor.empty() || cursor.peek().kind != TK::LeftParen) {
    throw exceptions::ParseError("expected '(' after command name '" + name.text + "'", cursor.peek().location(),
                                 describe(cursor), lex::to_string(TK::LeftParen));
  }
  auto lparen = cst::Node::Make(cst::NodeKind::LParen);
  lparen->append(cursor.pop());
  statement->append(std::move(lparen));

  const BreakStack breakstack = BreakStack{}.extended(Breaker::Paren());
  auto args = ParseGrammar(cursor, registry_.lookup(command), breakstack);
  const std::size_t argsIdx = statement->append(std::move(args));

  // Leftovers an exact-arity grammar did not take
  while (!cursor.empty() && cursor.peek().kind != TK::RightParen) {
    if (lex::isWhitespace(cursor.peek().kind)) {
      statement->append(cursor.pop());
    } else if (lex::isComment(cursor.peek().kind)) {
      statement->append(ConsumeComment(cursor));
    } else {
      break;
    }
  }
  if (cursor.empty() || cursor.peek().kind != TK::RightParen) {
    throw exceptions::ParseError("unterminated argument list of '" + name.text + "'", cursor.peek().location(),
                                 describe(cursor), lex::to_string(TK::RightParen));
  }
  auto rparen = cst::Node::Make(cst::NodeKind::RParen);
  rparen->append(cursor.pop());
  statement->append(std::move(rparen));
  ConsumeTrailingComment(cursor, *statement);

  statement->payload = cst::StatementInfo{command, argsIdx};
  return statement;
}

} // namespace cmfmt::parse
