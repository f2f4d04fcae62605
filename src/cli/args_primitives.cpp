#include "cli/ParseArgsInternals.h"

namespace cmfmt::cli::detail {

bool isFlag(const std::string_view arg, const std::string_view flag) {
    return arg == flag;
}

// "-x" and "--xyz"; a lone "-" is not an option
bool isUnknownOptionArg(const std::string_view arg) {
    return arg.size() > 1 && arg[0] == '-';
}

void collectRemainingAsInputs(std::size_t startIndex, int argc, char** argv, Options& out) {
    for (int j = static_cast<int>(startIndex); j < argc; ++j) {
        // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        out.inputs.emplace_back(argv[j]);
    }
}

/***
 * Name: cmfmt::cli::detail::parseColorValue
 * Purpose: Parse --color value into ColorMode; anything unrecognized means auto.
 */
ColorMode parseColorValue(const std::string_view value) {
    using enum cmfmt::cli::ColorMode;
    if (value == "always") { return Always; }
    if (value == "never") { return Never; }
    return Auto;
}

} // namespace cmfmt::cli::detail
