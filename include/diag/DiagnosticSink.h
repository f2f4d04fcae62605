/***
 * Name: cmfmt::diag::DiagnosticSink
 * Purpose: Append-only collector for non-fatal diagnostics.
 * Inputs:
 *   - record(id, payload, location) for lint findings
 *   - warn(message, location) for free-form warnings (config, booleans)
 * Outputs:
 *   - diagnostics() in the order they were recorded
 * Theory of Operation:
 *   Owned by the caller and passed explicitly to whatever may report; the
 *   parser itself never writes here.
 */
#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "diag/Diagnostic.h"
#include "lexer/SourceLocation.h"

namespace cmfmt::diag {

class DiagnosticSink {
 public:
  void record(std::string_view id, const std::string& payload, const lex::SourceLocation& where);
  void warn(const std::string& message, const lex::SourceLocation& where = {});

  const std::vector<Diagnostic>& diagnostics() const { return items_; }
  bool empty() const { return items_.empty(); }
  std::size_t size() const { return items_.size(); }
  std::size_t errorCount() const;
  void clear() { items_.clear(); }

 private:
  std::vector<Diagnostic> items_{};
};

// "file:line:col: warning: [E1125] message"
void PrintDiagnostic(std::ostream& os, const Diagnostic& d);

} // namespace cmfmt::diag
