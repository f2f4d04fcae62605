#pragma once

#include <string>
#include <vector>

#include "ColorMode.h"

namespace cmfmt::cli {

    enum class DumpMode {
        Roundtrip,
        Tokens,
        Tree
    };

    struct Options {
        bool showHelp{false};
        bool check{false};            // --check
        bool lint{false};             // --lint
        bool dumpConfig{false};       // --dump-config
        bool metrics{false};          // --metrics
        bool metricsJson{false};      // --metrics-json
        std::string outputFile{};     // -o <file> (empty: stdout)
        std::string configFile{};     // -c <file> / --config-file=<file>
        std::vector<std::string> inputs{};
        DumpMode dump{DumpMode::Roundtrip};
        ColorMode color{ColorMode::Auto};
        int diagContext{1};
        std::string logPath{"."};    // --log-path=<dir> (defaults to ./)
        bool logLexer{false};         // --log-lexer
        bool logTree{false};          // --log-tree
    };

} // namespace cmfmt::cli
