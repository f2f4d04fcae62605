/***
 * Name: cmfmt::diag::Diagnostic
 * Purpose: One non-fatal finding (lint result or configuration warning).
 */
#pragma once

#include <string>

namespace cmfmt::diag {

enum class Severity { Warning, Error };

const char* to_string(Severity severity);

struct Diagnostic {
  std::string id{};      // e.g. "E1125"; empty for free-form warnings
  Severity severity{Severity::Warning};
  std::string message{};
  std::string file{};
  int line{0};
  int col{0};
};

} // namespace cmfmt::diag
