#include "cli/ParseArgs.h"
#include "cli/ColorMode.h"
#include "cli/Options.h"
#include "cli/ParseArgsInternals.h"
#include <iostream>

namespace cmfmt::cli {
    /***
     * Name: cmfmt::cli::ParseArgs
     * Purpose: Command-line parser for cmfmt.
     */
    bool ParseArgs(const int argc, char **argv, Options &out) {
        for (int i = 1; i < argc; ++i) {
            // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            const std::string_view arg{argv[i]};
            if (detail::isFlag(arg, "--")) {
                detail::collectRemainingAsInputs(i + 1, argc, argv, out);
                break;
            }
            if (detail::isFlag(arg, "-o") || detail::isFlag(arg, "-c")) {
                if (detail::handleOutputFileFlag(i, argc, argv, out)) { continue; }
                if (detail::handleConfigFileFlag(i, argc, argv, out)) { continue; }
                std::cerr << "cmfmt: missing argument to '" << arg << "'\n";
                return false;
            }
            if (constexpr std::string_view dumpPrefix{"--dump="};
                arg.rfind(dumpPrefix, 0) == 0 && !detail::parseDumpValue(arg.substr(dumpPrefix.size()))) {
                std::cerr << "cmfmt: unknown dump mode '" << arg.substr(dumpPrefix.size()) << "'\n";
                return false;
            }
            if (detail::applySimpleBoolFlags(arg, out)) { continue; }
            if (detail::applyPrefixedOptions(arg, out)) { continue; }

            // Positional
            if (detail::isUnknownOptionArg(arg)) {
                std::cerr << "cmfmt: unknown option '" << arg << "'\n";
                return false;
            }
            out.inputs.emplace_back(std::string(arg));
        }

        if (detail::hasConflictingModes(out)) {
            std::cerr << "cmfmt: --check only applies to --dump=roundtrip\n";
            return false;
        }

        return true;
    }
} // namespace cmfmt::cli
