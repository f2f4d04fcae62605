#ifndef CMFMT_DRIVER_APP_H
#define CMFMT_DRIVER_APP_H

/***
 * Name: cmfmt::App
 * Purpose: Orchestrate config loading, lexing, parsing, lint and output.
 * Inputs:
 *   - CLI options
 * Outputs:
 *   - Reconstructed text, token/tree dumps, diagnostics, logs; exit code
 * Theory of Operation:
 *   Loads the configuration and builds the command registry once, then
 *   lexes and parses each input into a CST. The requested views of the tree
 *   are written to `out`; errors and warnings go to `err`. Exit codes:
 *   0 success, 1 parse/lint/check failure, 2 usage or configuration error.
 */

#include <iosfwd>

// Forward declarations to reduce header coupling
namespace cmfmt { namespace cli { struct Options; } }
namespace cmfmt { namespace diag { struct Diagnostic; } }

namespace cmfmt {
    class App {
    public:
        static int run(const cli::Options &opts);

        static int run(const cli::Options &opts, std::ostream &out, std::ostream &err);

        static bool use_env_color();

        static void print_error(std::ostream &err, const diag::Diagnostic &diag, bool color, int context);
    };
} // namespace cmfmt

#endif // CMFMT_DRIVER_APP_H
