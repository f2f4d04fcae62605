/***
 * Name: cmfmt::config::ParseBool
 * Purpose: Truthiness of configuration strings with an explicit warning channel.
 */
#include "config/ParseBool.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <string>

namespace cmfmt::config {

bool ParseBool(const std::string_view text, diag::DiagnosticSink& sink, const lex::SourceLocation& where) {
  static constexpr std::array<std::string_view, 8> kTruthy{"y", "yes", "t", "true", "1", "yup", "yeah", "yada"};
  static constexpr std::array<std::string_view, 8> kFalsy{"n", "no", "f", "false", "0", "nope", "nah", "nada"};
  std::string lowered(text);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (std::find(kTruthy.begin(), kTruthy.end(), lowered) != kTruthy.end()) { return true; }
  if (std::find(kFalsy.begin(), kFalsy.end(), lowered) != kFalsy.end()) { return false; }
  sink.warn("Ambiguous truthiness of string '" + std::string(text) + "' evaluates to 'FALSE'", where);
  return false;
}

} // namespace cmfmt::config
