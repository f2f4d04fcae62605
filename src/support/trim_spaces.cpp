/***
 * Name: cmfmt::support::TrimLeadingSpaces / TrimTrailingSpaces
 * Purpose: Remove ASCII whitespace from either end of a string_view.
 * Inputs: text (by ref)
 * Outputs: text with prefix/suffix removed
 */
#include "cmfmt/support/parse_util.h"

#include <cctype>
#include <cstddef>
#include <string_view>

namespace cmfmt {
namespace support {

void TrimLeadingSpaces(std::string_view& text) {
  std::size_t index = 0;
  while (index < text.size() && std::isspace(static_cast<unsigned char>(text[index])) != 0) {
    ++index;
  }
  if (index > 0) {
    text.remove_prefix(index);
  }
}

void TrimTrailingSpaces(std::string_view& text) {
  std::size_t count = 0;
  while (count < text.size() &&
         std::isspace(static_cast<unsigned char>(text[text.size() - 1 - count])) != 0) {
    ++count;
  }
  if (count > 0) {
    text.remove_suffix(count);
  }
}

}  // namespace support
}  // namespace cmfmt
