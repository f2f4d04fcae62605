#include "cli/ParseArgsInternals.h"

namespace cmfmt::cli::detail {
    /***
     * Name: cmfmt::cli::detail::applySimpleBoolFlags
     * Purpose: Handle flag-only boolean options and set outputs.
     */
    bool applySimpleBoolFlags(std::string_view arg, Options &out) {
        if (isFlag(arg, "-h") || isFlag(arg, "--help")) {
            out.showHelp = true;
            return true;
        }
        if (isFlag(arg, "--check")) {
            out.check = true;
            return true;
        }
        if (isFlag(arg, "--lint")) {
            out.lint = true;
            return true;
        }
        if (isFlag(arg, "--dump-config")) {
            out.dumpConfig = true;
            return true;
        }
        if (isFlag(arg, "--metrics")) {
            out.metrics = true;
            return true;
        }
        if (isFlag(arg, "--metrics-json")) {
            out.metricsJson = true;
            return true;
        }
        if (isFlag(arg, "--log-lexer")) {
            out.logLexer = true;
            return true;
        }
        if (isFlag(arg, "--log-tree")) {
            out.logTree = true;
            return true;
        }
        return false;
    }
} // namespace cmfmt::cli::detail
