#include "cli/ParseArgsInternals.h"

namespace cmfmt::cli::detail {

/***
 * Name: cmfmt::cli::detail::parseDumpValue
 * Purpose: Parse --dump value into DumpMode.
 */
std::optional<DumpMode> parseDumpValue(std::string_view value) {
    using enum cmfmt::cli::DumpMode;
    if (value == "roundtrip") { return Roundtrip; }
    if (value == "tokens") { return Tokens; }
    if (value == "tree") { return Tree; }
    return std::nullopt;
}

} // namespace cmfmt::cli::detail
