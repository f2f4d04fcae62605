/***
 * Name: cmfmt::support (case)
 * Purpose: Unicode-aware case mapping for command names and keywords.
 * Inputs: UTF-8 text
 * Outputs: UTF-8 text mapped with ICU
 * Theory of Operation: Converts to UTF-16, applies u_strToUpper/u_strFoldCase
 *   and converts back. Invalid UTF-8 is returned unchanged.
 */
#pragma once

#include <string>
#include <string_view>

namespace cmfmt {
namespace support {

/*** UpperCase: Keyword normalization (root-locale full upper-casing). */
std::string UpperCase(std::string_view text);

/*** FoldCase: Command-name normalization (default case folding). */
std::string FoldCase(std::string_view text);

}  // namespace support
}  // namespace cmfmt
