#include "cli/ParseArgsInternals.h"

#include "cmfmt/support/parse.h"

#include <algorithm>
#include <string>

namespace cmfmt::cli::detail {
    /***
     * Name: cmfmt::cli::detail::applyPrefixedOptions
     * Purpose: Parse and apply --key=value options like config-file/dump/color/diag-context.
     */
    bool applyPrefixedOptions(std::string_view arg, Options &out) {
        if (constexpr std::string_view configPrefix{"--config-file="}; arg.rfind(configPrefix, 0) == 0) {
            out.configFile = std::string(arg.substr(configPrefix.size()));
            return true;
        }

        if (constexpr std::string_view dumpPrefix{"--dump="}; arg.rfind(dumpPrefix, 0) == 0) {
            out.dump = parseDumpValue(arg.substr(dumpPrefix.size())).value_or(DumpMode::Roundtrip);
            return true;
        }

        if (constexpr std::string_view logPathPrefix{"--log-path="}; arg.rfind(logPathPrefix, 0) == 0) {
            out.logPath = std::string(arg.substr(logPathPrefix.size()));
            return true;
        }

        if (constexpr std::string_view colorPrefix{"--color="}; arg.rfind(colorPrefix, 0) == 0) {
            out.color = parseColorValue(arg.substr(colorPrefix.size()));
            return true;
        }

        if (constexpr std::string_view diagPrefix{"--diag-context="}; arg.rfind(diagPrefix, 0) == 0) {
            int numLines = 0;
            if (!support::ParseIntLiteralStrict(arg.substr(diagPrefix.size()), numLines)) { numLines = 0; }
            out.diagContext = std::max(numLines, 0);
            return true;
        }
        return false;
    }
} // namespace cmfmt::cli::detail
