/***
 * Name: cmfmt::obs::TreePrinter
 * Purpose: CST pretty-printer for diagnostics and logging.
 * Inputs:
 *   - cst::Node (usually the BODY of a file)
 * Outputs:
 *   - Indented outline, one node per line: kind, salient spelling and
 *     annotations (command name, arity, sortable, conditional)
 * Theory of Operation:
 *   Depth-first walk; each level indents by two spaces. Whitespace tokens
 *   are skipped unless showWhitespace is set, in which case every raw token
 *   child is listed with its kind.
 */
#pragma once

#include <sstream>
#include <string>

#include "cst/Node.h"

namespace cmfmt::obs {

class TreePrinter {
 public:
  explicit TreePrinter(bool showWhitespace = false) : showWhitespace_(showWhitespace) {}

  std::string print(const cst::Node& root);

 private:
  bool showWhitespace_;
  std::ostringstream ss_;
  int depth_{0};

  void node(const cst::Node& n);
  void token(const lex::Token& t);
  void line(const std::string& s);
};

} // namespace cmfmt::obs
