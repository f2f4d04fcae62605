/***
 * Name: cmfmt::lint::Linter
 * Purpose: Walk the statements of a parsed file and run per-command checks.
 * Inputs:
 *   - BODY node from parse::Parser, the registry used to parse it
 * Outputs:
 *   - Diagnostics appended to the sink in source order
 * Theory of Operation:
 *   Read-only traversal; flow-control blocks are entered so nested
 *   statements are checked too.
 */
#pragma once

#include <cstddef>

#include "cst/Node.h"
#include "diag/DiagnosticSink.h"
#include "grammar/CommandRegistry.h"

namespace cmfmt::lint {

class Linter {
 public:
  Linter(const grammar::CommandRegistry& registry, diag::DiagnosticSink& sink) : registry_(registry), sink_(sink) {}

  // Returns the number of diagnostics added
  std::size_t run(const cst::Node& body);

 private:
  const grammar::CommandRegistry& registry_;
  diag::DiagnosticSink& sink_;

  void visit(const cst::Node& node);
  void checkStatement(const cst::Node& statement);
};

} // namespace cmfmt::lint
