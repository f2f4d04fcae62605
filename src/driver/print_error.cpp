#include "driver/App.h"
#include "diag/Diagnostic.h"
#include <fstream>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace cmfmt {
    // ANSI fragments
    static constexpr std::string_view kRed = "\033[31m";
    static constexpr std::string_view kMagenta = "\033[35m";
    static constexpr std::string_view kBold = "\033[1m";
    static constexpr std::string_view kReset = "\033[0m";

    static void print_header(std::ostream &err, const diag::Diagnostic &diag, const bool color) {
        if (diag.file.empty()) { return; }
        if (color) { err << kBold; }
        err << diag.file << ':' << diag.line << ':' << diag.col << ": ";
        if (color) { err << kReset; }
    }

    static void print_label(std::ostream &err, const diag::Diagnostic &diag, const bool color) {
        const bool isError = diag.severity == diag::Severity::Error;
        if (color) { err << (isError ? kRed : kMagenta); }
        err << (isError ? "error: " : "warning: ");
        if (color) { err << kReset; }
        if (!diag.id.empty()) { err << '[' << diag.id << "] "; }
    }

    // `context` lines before the offending one, then the line and a caret
    static void print_source_with_caret(std::ostream &err, const diag::Diagnostic &diag, const int context) {
        if (diag.file.empty() || diag.line <= 0 || diag.col <= 0) { return; }
        std::ifstream input(diag.file, std::ios::binary);
        if (!input) { return; }
        std::vector<std::string> window;
        std::string lineStr;
        int curLine = 0;
        while (curLine < diag.line && std::getline(input, lineStr)) {
            ++curLine;
            if (!lineStr.empty() && lineStr.back() == '\r') { lineStr.pop_back(); }
            window.push_back(lineStr);
            if (static_cast<int>(window.size()) > context + 1) { window.erase(window.begin()); }
        }
        if (curLine != diag.line) { return; }
        for (const auto &text : window) { err << "  " << text << '\n'; }
        err << "  " << std::string(static_cast<std::size_t>(diag.col - 1), ' ') << "^\n";
    }

    void App::print_error(std::ostream &err, const diag::Diagnostic &diag, const bool color, const int context) {
        print_header(err, diag, color);
        print_label(err, diag, color);
        err << diag.message << '\n';
        print_source_with_caret(err, diag, context);
    }
} // namespace cmfmt
