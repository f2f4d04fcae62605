/***
 * Name: cmfmt::diag diagnostic id table (impl)
 */
#include "diag/DiagnosticIds.h"

#include <array>

namespace cmfmt::diag {

namespace {
constexpr std::array<DiagnosticInfo, 1> kTable{{
    {kMissingRequiredKwarg, "Missing required keyword argument: %s", true},
}};
} // namespace

const DiagnosticInfo* FindDiagnostic(const std::string_view id) {
  for (const auto& info : kTable) {
    if (info.id == id) { return &info; }
  }
  return nullptr;
}

std::string FormatDiagnostic(const std::string_view id, const std::string& payload) {
  const auto* info = FindDiagnostic(id);
  if (info == nullptr) { return payload; }
  std::string out(info->format);
  const auto slot = out.find("%s");
  if (slot != std::string::npos) { out.replace(slot, 2, payload); }
  return out;
}

} // namespace cmfmt::diag
