#include "cli/Usage.h"
#include <string>
#include <string_view>
namespace cmfmt::cli {

namespace {
constexpr std::string_view kUsageText = R"(cmfmt [options] file...

Options:
  -h, --help              Print this help and exit
  -o <file>               Write the reconstructed listfile to <file> (default: stdout)
  -c <file>, --config-file=<file>
                          Load formatter configuration from <file>
  --dump=<mode>           What to print: roundtrip|tokens|tree (default: roundtrip)
  --check                 Exit 1 unless reconstruction matches the input exactly
  --lint                  Run lint checks and print diagnostics (exit 1 if any)
  --dump-config           Print the effective configuration and exit
  --metrics               Print metrics summary
  --metrics-json          Print metrics in JSON
  --log-path=<dir>        Directory where logs are written (lexer/tree)
  --log-lexer             Enable lexer token log (requires --log-path)
  --log-tree              Enable CST file logs (requires --log-path)
  --color=<mode>          Color diagnostics: always|never|auto (default: auto)
  --diag-context=<N>      Lines of context to show around errors (default: 1)
  --                      End of options
)";
} // namespace

std::string Usage() { return std::string(kUsageText); }
} // namespace cmfmt::cli
