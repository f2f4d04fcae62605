/***
 * Name: cmfmt::support (parse_util)
 * Purpose: Whitespace trimming for string_view inputs.
 * Theory of Operation: Shared by ParseIntLiteralStrict and the config file reader.
 */
#pragma once

#include <string_view>

namespace cmfmt {
namespace support {

/*** TrimLeadingSpaces: Remove leading ASCII whitespace from view. */
void TrimLeadingSpaces(std::string_view& text);

/*** TrimTrailingSpaces: Remove trailing ASCII whitespace from view. */
void TrimTrailingSpaces(std::string_view& text);

}  // namespace support
}  // namespace cmfmt
