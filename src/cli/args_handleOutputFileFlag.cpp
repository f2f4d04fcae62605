#include "cli/ParseArgsInternals.h"

namespace cmfmt::cli::detail {
    /***
     * Name: cmfmt::cli::detail::handleOutputFileFlag
     * Purpose: Handle `-o <file>` output flag by consuming the next argument.
     */
    bool handleOutputFileFlag(int &idx, int argc, char **argv, Options &out) {
        // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        if (const std::string_view arg{argv[idx]}; !isFlag(arg, "-o")) { return false; }
        if (idx + 1 >= argc) { return false; }
        // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        out.outputFile = argv[++idx];
        return true;
    }

    /***
     * Name: cmfmt::cli::detail::handleConfigFileFlag
     * Purpose: Handle `-c <file>` by consuming the next argument.
     */
    bool handleConfigFileFlag(int &idx, int argc, char **argv, Options &out) {
        // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        if (const std::string_view arg{argv[idx]}; !isFlag(arg, "-c")) { return false; }
        if (idx + 1 >= argc) { return false; }
        // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        out.configFile = argv[++idx];
        return true;
    }
} // namespace cmfmt::cli::detail
