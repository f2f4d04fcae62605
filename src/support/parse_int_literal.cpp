/***
 * Name: cmfmt::support::ParseIntLiteralStrict
 * Purpose: Parse a base-10 integer without throwing; surrounding whitespace is ignored.
 * Inputs:
 *   - text: string view of the literal, optionally signed
 * Outputs:
 *   - out_val: parsed integer on success (untouched on failure)
 *   - err: optional error message on failure
 */
#include "cmfmt/support/parse.h"
#include "cmfmt/support/parse_util.h"

#include <charconv>
#include <system_error>

namespace cmfmt::support {

bool ParseIntLiteralStrict(std::string_view text, int& out_val, std::string* err) {
  const auto fail = [err](const char* why) {
    if (err != nullptr) { *err = why; }
    return false;
  };
  TrimLeadingSpaces(text);
  TrimTrailingSpaces(text);
  // from_chars takes '-' but not '+'
  if (text.size() > 1 && text.front() == '+' && text[1] != '-') { text.remove_prefix(1); }
  if (text.empty()) { return fail("invalid integer literal"); }

  int value = 0;
  const char* const end = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(text.data(), end, value);
  if (ec == std::errc::result_out_of_range) { return fail("integer overflow"); }
  if (ec != std::errc{}) { return fail("invalid integer literal"); }
  if (ptr != end) { return fail("invalid character in integer literal"); }
  out_val = value;
  return true;
}

}  // namespace cmfmt::support
