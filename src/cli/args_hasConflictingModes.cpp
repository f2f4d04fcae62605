#include "cli/ParseArgsInternals.h"

namespace cmfmt::cli::detail {
    /***
     * Name: cmfmt::cli::detail::hasConflictingModes
     * Purpose: Validate mutually exclusive output modes.
     */
    bool hasConflictingModes(const Options &opts) {
        return opts.check && opts.dump != DumpMode::Roundtrip;
    }
} // namespace cmfmt::cli::detail
