/***
 * Name: cmfmt::diag::DiagnosticSink (impl)
 */
#include "diag/DiagnosticSink.h"

#include <algorithm>

#include "diag/DiagnosticIds.h"

namespace cmfmt::diag {

const char* to_string(const Severity severity) {
  return severity == Severity::Error ? "error" : "warning";
}

void DiagnosticSink::record(const std::string_view id, const std::string& payload,
                            const lex::SourceLocation& where) {
  const auto* info = FindDiagnostic(id);
  Diagnostic d;
  d.id = std::string(id);
  d.severity = (info != nullptr && info->error) ? Severity::Error : Severity::Warning;
  d.message = FormatDiagnostic(id, payload);
  d.file = where.file;
  d.line = where.line;
  d.col = where.col;
  items_.push_back(std::move(d));
}

void DiagnosticSink::warn(const std::string& message, const lex::SourceLocation& where) {
  Diagnostic d;
  d.severity = Severity::Warning;
  d.message = message;
  d.file = where.file;
  d.line = where.line;
  d.col = where.col;
  items_.push_back(std::move(d));
}

std::size_t DiagnosticSink::errorCount() const {
  return static_cast<std::size_t>(std::count_if(items_.begin(), items_.end(), [](const Diagnostic& d) {
    return d.severity == Severity::Error;
  }));
}

void PrintDiagnostic(std::ostream& os, const Diagnostic& d) {
  if (!d.file.empty()) {
    os << d.file << ':' << d.line << ':' << d.col << ": ";
  }
  os << to_string(d.severity) << ": ";
  if (!d.id.empty()) { os << '[' << d.id << "] "; }
  os << d.message << '\n';
}

} // namespace cmfmt::diag
