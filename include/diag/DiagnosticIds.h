/***
 * Name: cmfmt::diag diagnostic id table
 * Purpose: Map lint ids to message templates.
 * Theory of Operation:
 *   Templates carry a single "%s" slot that DiagnosticSink::record() fills
 *   with the payload.
 */
#pragma once

#include <string>
#include <string_view>

namespace cmfmt::diag {

inline constexpr std::string_view kMissingRequiredKwarg = "E1125";

struct DiagnosticInfo {
  std::string_view id;
  std::string_view format;
  bool error;
};

// nullptr for ids not in the table
const DiagnosticInfo* FindDiagnostic(std::string_view id);

std::string FormatDiagnostic(std::string_view id, const std::string& payload);

} // namespace cmfmt::diag
