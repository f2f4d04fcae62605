/***
 * Name: cmfmt::parse::Parser
 * Purpose: Build a lossless CST for a whole listfile.
 * Inputs:
 *   - Any ITokenStream, drained once from its current position into a
 *     TokenCursor
 *   - Command registry supplying each command's argument grammar
 * Outputs:
 *   - BODY node holding statements, comments, format switches and
 *     flow-control blocks; every source token is reachable from it
 * Theory of Operation:
 *   Recursive descent over the file structure:
 *     body      := { whitespace | comment | switch | statement | block }
 *     statement := NAME [ws] '(' args ')' [trailing-comment]
 *     block     := opener-statement body closer-statement
 *   `args` is handed to ParseGrammar() with the command's descriptor under a
 *   right-paren breakstack.
 */
#pragma once

#include <string>
#include <vector>

#include "cst/Node.h"
#include "grammar/CommandRegistry.h"
#include "lexer/ITokenStream.h"
#include "parser/TokenCursor.h"

namespace cmfmt::parse {

class Parser {
 public:
  Parser(lex::ITokenStream& stream, const grammar::CommandRegistry& registry)
      : ts_(stream), registry_(registry) {}

  cst::NodePtr parseFile();

  // Folded closer name for a block-opening command, empty otherwise
  static std::string blockCloser(const std::string& command);

 private:
  lex::ITokenStream& ts_;
  const grammar::CommandRegistry& registry_;

  static std::vector<lex::Token> drain(lex::ITokenStream& stream);

  cst::NodePtr parseBody(TokenCursor& cursor, const std::string& closer);
  cst::NodePtr parseStatement(TokenCursor& cursor);
  cst::NodePtr parseFlowControl(TokenCursor& cursor, cst::NodePtr opener, const std::string& closer);
  static std::string peekCommand(const TokenCursor& cursor);
};

} // namespace cmfmt::parse
