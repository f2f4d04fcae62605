/***
 * Name: cmfmt::App::run
 * Purpose: Execute the listfile pipeline end-to-end for each input.
 */
#include "driver/App.h"
#include "cli/ColorMode.h"
#include "cli/Options.h"
#include "cmfmt/exceptions/config_error.h"
#include "cmfmt/exceptions/file_read_error.h"
#include "cmfmt/exceptions/parse_error.h"
#include "cmfmt/support/fs.h"
#include "config/ConfigLoader.h"
#include "cst/GeometrySummary.h"
#include "diag/DiagnosticSink.h"
#include "lexer/Lexer.h"
#include "lint/Linter.h"
#include "observability/Metrics.h"
#include "observability/TreePrinter.h"
#include "parser/Parser.h"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <system_error>
#include <unistd.h>
#include <vector>

namespace cmfmt {

namespace {

struct RunContext {
  const cli::Options& opts;
  std::ostream& out;
  std::ostream& err;
  config::Configuration& cfg;
  const grammar::CommandRegistry& registry;
  obs::Metrics& metrics;
  bool color{false};
  bool logsEnabled{false};
  std::string logDir{};
  std::string tsPrefix{};
  std::string output{}; // accumulated reconstruction for -o
};

std::string timestampPrefix() {
  auto tsNow = std::chrono::system_clock::now();
  const std::time_t tsTime = std::chrono::system_clock::to_time_t(tsNow);
  std::tm tmBuf{};
#ifdef _WIN32
  localtime_s(&tmBuf, &tsTime);
#else
  localtime_r(&tsTime, &tmBuf);
#endif
  std::ostringstream timestampStream;
  timestampStream << std::put_time(&tmBuf, "%Y%m%d-%H%M%S");
  return timestampStream.str() + "-";
}

std::string escaped(const std::string& text) {
  std::string out;
  for (const char c : text) {
    if (c == '\n') { out += "\\n"; }
    else if (c == '\r') { out += "\\r"; }
    else if (c == '\t') { out += "\\t"; }
    else { out.push_back(c); }
  }
  return out;
}

// First newline decides; files without one are treated as unix
config::LineEnding detectLineEnding(const std::vector<lex::Token>& tokens) {
  for (const auto& tok : tokens) {
    if (tok.kind == lex::TokenKind::Newline) {
      return tok.text == "\r\n" ? config::LineEnding::Windows : config::LineEnding::Unix;
    }
  }
  return config::LineEnding::Unix;
}

void countNodes(const cst::Node& node, uint64_t& statements, uint64_t& comments) {
  if (node.kind == cst::NodeKind::Statement) { ++statements; }
  if (node.kind == cst::NodeKind::Comment) { ++comments; }
  for (const auto* child : node.childNodes()) { countNodes(*child, statements, comments); }
}

bool prepareLogDir(const std::string& logDir, std::ostream& err) {
  std::error_code errCode;
  namespace fs = std::filesystem;
  if (fs::exists(logDir, errCode)) { return true; }
  if (!fs::create_directories(logDir, errCode) && !fs::exists(logDir)) {
    err << "cmfmt: failed to create log directory '" << logDir << "': " << errCode.message() << "\n";
    return false;
  }
  return true;
}

void printDiagnostics(RunContext& ctx, const diag::DiagnosticSink& sink, std::ostream& os) {
  for (const auto& d : sink.diagnostics()) {
    App::print_error(os, d, ctx.color, ctx.opts.diagContext);
  }
}

int processFile(RunContext& ctx, const std::string& input) {
  const auto& opts = ctx.opts;

  ctx.metrics.incCounter("input.files");
  lex::Lexer lexer; // NOLINT(misc-const-correctness)
  lexer.pushFile(input);
  std::vector<lex::Token> tokens;
  {
    const obs::Metrics::Stage stage(ctx.metrics, "Lex");
    tokens = lexer.tokens();
  }
  ctx.metrics.incCounter("lex.tokens", static_cast<uint64_t>(tokens.size()));

  if (ctx.cfg.lineEnding == config::LineEnding::Auto) {
    ctx.cfg.setLineEnding(detectLineEnding(tokens));
  }
  const std::string& endl = ctx.cfg.endl();

  if (ctx.logsEnabled && opts.logLexer) {
    std::ofstream lexFile(ctx.logDir + "/" + ctx.tsPrefix + "lexer.lex.log");
    for (const auto& tok : tokens) {
      lexFile << tok.file << ":" << tok.line << ":" << tok.col << " " << to_string(tok.kind) << " "
              << escaped(tok.text) << "\n";
    }
  }

  if (opts.dump == cli::DumpMode::Tokens) {
    for (const auto& tok : tokens) {
      ctx.out << tok.line << ":" << tok.col << " " << to_string(tok.kind) << " \"" << escaped(tok.text) << "\""
              << endl;
    }
  }

  cst::NodePtr body;
  {
    const obs::Metrics::Stage stage(ctx.metrics, "Parse");
    parse::Parser parser(lexer, ctx.registry);
    body = parser.parseFile();
  }

  uint64_t statements = 0;
  uint64_t comments = 0;
  countNodes(*body, statements, comments);
  ctx.metrics.incCounter("parse.statements", statements);
  ctx.metrics.incCounter("parse.comments", comments);
  const auto geom = cst::ComputeGeometry(*body);
  ctx.metrics.addTreeGeometry({geom.nodes, geom.maxDepth});

  if (ctx.logsEnabled && opts.logTree) {
    obs::TreePrinter printer(true); // NOLINT(misc-const-correctness)
    std::ofstream treeFile(ctx.logDir + "/" + ctx.tsPrefix + "tree.cst.log");
    treeFile << printer.print(*body);
  }

  if (opts.dump == cli::DumpMode::Tree) {
    obs::TreePrinter printer; // NOLINT(misc-const-correctness)
    std::istringstream lines(printer.print(*body));
    for (std::string line; std::getline(lines, line);) { ctx.out << line << endl; }
  }

  int status = 0;
  if (opts.lint) {
    diag::DiagnosticSink lintSink;
    std::size_t found = 0;
    {
      const obs::Metrics::Stage stage(ctx.metrics, "Lint");
      found = lint::Linter(ctx.registry, lintSink).run(*body);
    }
    ctx.metrics.incCounter("lint.diagnostics", static_cast<uint64_t>(found));
    printDiagnostics(ctx, lintSink, ctx.out);
    if (found > 0) { status = 1; }
  }

  const std::string reconstructed = body->reconstruct();
  if (opts.check) {
    std::string original;
    std::string readErr;
    if (!support::ReadFile(input, original, readErr)) {
      throw exceptions::FileReadError("unable to read '" + input + "': " + readErr);
    }
    if (original != reconstructed) {
      ctx.err << "cmfmt: " << input << ": reconstruction differs from input\n";
      status = 1;
    }
  } else if (opts.dump == cli::DumpMode::Roundtrip && !opts.lint) {
    if (opts.outputFile.empty()) {
      ctx.out << reconstructed;
    } else {
      ctx.output += reconstructed;
    }
  }
  return status;
}

} // namespace

int App::run(const cli::Options& opts) {
  return run(opts, std::cout, std::cerr);
}

int App::run(const cli::Options& opts, std::ostream& out, std::ostream& err) { // NOLINT(readability-function-size)
  bool color = false;
  if (opts.color == cli::ColorMode::Always) { color = true; }
  else if (opts.color == cli::ColorMode::Never) { color = false; }
  else { constexpr int kStderrFd = 2; color = (isatty(kStderrFd) != 0) || use_env_color(); }

  config::Configuration cfg;
  diag::DiagnosticSink configSink;
  try {
    if (!opts.configFile.empty()) {
      cfg = config::LoadConfigFile(opts.configFile, configSink);
    }
  } catch (const exceptions::ConfigError& ex) {
    err << "cmfmt: config error: " << ex.what() << "\n";
    return 2;
  }
  for (const auto& d : configSink.diagnostics()) {
    print_error(err, d, color, 0);
  }

  if (opts.dumpConfig) {
    config::DumpConfig(out, cfg);
    return 0;
  }
  if (opts.inputs.empty()) {
    err << "cmfmt: no input files provided\n";
    return 2;
  }
  if (!opts.outputFile.empty() && opts.inputs.size() > 1) {
    err << "cmfmt: -o requires a single input file\n";
    return 2;
  }

  const auto registry = config::BuildRegistry(cfg);
  obs::Metrics metrics;
  RunContext ctx{opts, out, err, cfg, registry, metrics};
  ctx.color = color;
  ctx.logDir = opts.logPath.empty() ? std::string(".") : opts.logPath;
  ctx.tsPrefix = timestampPrefix();
  if (opts.logLexer || opts.logTree || opts.metrics || opts.metricsJson) {
    ctx.logsEnabled = prepareLogDir(ctx.logDir, err);
  }

  int status = 0;
  for (const auto& input : opts.inputs) {
    try {
      status = std::max(status, processFile(ctx, input));
    } catch (const exceptions::ParseError& ex) {
      diag::Diagnostic pd;
      pd.severity = diag::Severity::Error;
      pd.file = ex.location().file.empty() ? input : ex.location().file;
      pd.line = ex.location().line;
      pd.col = ex.location().col;
      pd.message = std::string("parse error: ") + ex.what();
      print_error(err, pd, color, opts.diagContext);
      status = 1;
    } catch (const exceptions::FileReadError& ex) {
      err << "cmfmt: " << ex.what() << "\n";
      status = 1;
    }
  }

  if (!opts.outputFile.empty() && status == 0 && opts.dump == cli::DumpMode::Roundtrip && !opts.check &&
      !opts.lint) {
    std::string writeErr;
    if (!support::WriteFile(opts.outputFile, ctx.output, writeErr)) {
      err << "cmfmt: unable to write '" << opts.outputFile << "': " << writeErr << "\n";
      return 1;
    }
  }

  // - With --metrics-json: JSON only
  // - With --metrics: human-readable text, then JSON
  if (opts.metricsJson) {
    out << metrics.summaryJson();
  } else if (opts.metrics) {
    out << metrics.summaryText();
    out << metrics.summaryJson();
  }

  if (opts.metrics || opts.metricsJson) {
    const auto jsonSummary = metrics.summaryJson();
    const std::string metricsPath = ctx.logsEnabled
        ? (ctx.logDir + "/" + ctx.tsPrefix + "metrics.json")
        : (std::string("./") + ctx.tsPrefix + std::string("metrics.json"));
    std::ofstream metricsFile(metricsPath);
    metricsFile << jsonSummary;
  }
  return status;
}

} // namespace cmfmt
