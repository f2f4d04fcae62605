/***
 * Name: cmfmt::config loader
 * Purpose: Apply `key = value` configuration text to a Configuration.
 * Theory of Operation:
 *   Lines are scanned with a small quote-aware splitter: '#' outside quotes
 *   starts a comment, '=' outside quotes separates key from value, and an
 *   open bracket keeps the value going on the next line. Dotted keys address
 *   one attribute of a custom command or one per-command override.
 */
#include "config/ConfigLoader.h"

#include <sstream>

#include "cmfmt/exceptions/config_error.h"
#include "cmfmt/support/case.h"
#include "cmfmt/support/fs.h"
#include "cmfmt/support/parse_util.h"

namespace cmfmt::config {

namespace {

struct LineScan {
  std::string code;  // line without its comment
  std::size_t equals{std::string::npos};
  int depth{0};      // bracket balance of `code`
};

LineScan scanLine(const std::string& line) {
  LineScan out;
  char quote = 0;
  for (std::size_t i = 0; i < line.size(); ++i) {
    const char c = line[i];
    if (quote != 0) {
      if (c == '\\' && i + 1 < line.size()) {
        out.code.push_back(c);
        out.code.push_back(line[++i]);
        continue;
      }
      if (c == quote) { quote = 0; }
      out.code.push_back(c);
      continue;
    }
    if (c == '#') { break; }
    if (c == '\'' || c == '"') { quote = c; }
    if (c == '[' || c == '(' || c == '{') { ++out.depth; }
    if (c == ']' || c == ')' || c == '}') { --out.depth; }
    if (c == '=' && out.equals == std::string::npos) { out.equals = out.code.size(); }
    out.code.push_back(c);
  }
  return out;
}

std::string trimmed(std::string_view text) {
  support::TrimLeadingSpaces(text);
  support::TrimTrailingSpaces(text);
  return std::string(text);
}

std::vector<std::string> splitDotted(const std::string& key) {
  std::vector<std::string> parts;
  std::size_t start = 0;
  for (;;) {
    const auto dot = key.find('.', start);
    parts.push_back(key.substr(start, dot == std::string::npos ? std::string::npos : dot - start));
    if (dot == std::string::npos) { break; }
    start = dot + 1;
  }
  return parts;
}

ConfigLiteral dictOf(const std::string& key, ConfigLiteral value) {
  ConfigLiteral out;
  out.kind = ConfigLiteral::Kind::Dict;
  out.entries.emplace_back(key, std::move(value));
  return out;
}

void applyCommandAttribute(Configuration& cfg, const std::vector<std::string>& parts, const ConfigLiteral& value) {
  const std::string command = support::FoldCase(parts[1]);
  if (!cfg.additionalCommands.contains(command)) {
    cfg.declareCommand(command, ConfigLiteral{ConfigLiteral::Kind::Dict});
  }
  grammar::ArgSpec& spec = cfg.additionalCommands.at(command);
  const std::string& attr = parts[2];
  const std::string context = "additional_commands." + command;

  if (attr == "kwargs" && parts.size() == 4) {
    const auto partial = CommandSpecFromLiteral(dictOf("kwargs", dictOf(parts[3], value)), context);
    for (const auto& [kw, body] : partial.kwargs) { spec.kwargs[kw] = body; }
    return;
  }
  if (parts.size() != 3) {
    throw exceptions::ConfigError("unsupported configuration key '" + context + "." + attr + "'");
  }
  const auto partial = CommandSpecFromLiteral(dictOf(attr, value), context);
  if (attr == "npargs" || attr == "pargs") {
    spec.npargs = partial.npargs;
    if (spec.kind == grammar::GrammarKind::Positional) { spec.kind = grammar::GrammarKind::Standard; }
  } else if (attr == "flags") {
    spec.flags = partial.flags;
  } else if (attr == "kwargs") {
    spec.kwargs = partial.kwargs;
  } else if (attr == "required") {
    spec.required = partial.required;
  } else if (attr == "sortable") {
    spec.sortable = partial.sortable;
  }
}

void applyEntry(Configuration& cfg, const std::string& key, const ConfigLiteral& value, diag::DiagnosticSink& sink,
                const lex::SourceLocation& where) {
  if (key.find('.') == std::string::npos) {
    if (key == "additional_commands" || key == "per_command" || FindField(key) != nullptr) {
      cfg.set(key, value, sink, where);
    } else {
      sink.warn("unknown configuration key '" + key + "'", where);
    }
    return;
  }
  const auto parts = splitDotted(key);
  if (parts[0] == "additional_commands" && parts.size() == 2) {
    cfg.declareCommand(parts[1], value);
  } else if (parts[0] == "additional_commands" && parts.size() >= 3) {
    applyCommandAttribute(cfg, parts, value);
  } else if (parts[0] == "per_command" && parts.size() == 3) {
    cfg.overrideCommand(parts[1], parts[2], value, sink, where);
  } else {
    sink.warn("unknown configuration key '" + key + "'", where);
  }
}

} // namespace

void ApplyConfigString(Configuration& cfg, const std::string& text, const std::string& name,
                       diag::DiagnosticSink& sink) {
  std::istringstream in(text);
  std::string line;
  int lineNo = 0;
  while (std::getline(in, line)) {
    ++lineNo;
    if (!line.empty() && line.back() == '\r') { line.pop_back(); }
    LineScan scan = scanLine(line);
    if (trimmed(scan.code).empty()) { continue; }

    const int startLine = lineNo;
    const lex::SourceLocation where{name, startLine, 1, 0};
    if (scan.equals == std::string::npos) {
      throw exceptions::ConfigError(name + ":" + std::to_string(startLine) + ": expected 'key = value'");
    }
    const std::string key = trimmed(std::string_view(scan.code).substr(0, scan.equals));
    std::string valueText = scan.code.substr(scan.equals + 1);
    int depth = scan.depth;
    while (depth > 0 && std::getline(in, line)) {
      ++lineNo;
      if (!line.empty() && line.back() == '\r') { line.pop_back(); }
      const LineScan more = scanLine(line);
      valueText += "\n" + more.code;
      depth += more.depth;
    }

    try {
      applyEntry(cfg, key, ParseConfigLiteral(valueText), sink, where);
    } catch (const exceptions::ConfigError& e) {
      throw exceptions::ConfigError(name + ":" + std::to_string(startLine) + ": " + e.what());
    }
  }
}

Configuration LoadConfigString(const std::string& text, const std::string& name, diag::DiagnosticSink& sink) {
  Configuration cfg;
  ApplyConfigString(cfg, text, name, sink);
  return cfg;
}

Configuration LoadConfigFile(const std::string& path, diag::DiagnosticSink& sink) {
  std::string text;
  std::string err;
  if (!support::ReadFile(path, text, err)) {
    throw exceptions::ConfigError("unable to read config file '" + path + "': " + err);
  }
  return LoadConfigString(text, path, sink);
}

grammar::CommandRegistry BuildRegistry(const Configuration& cfg) {
  auto registry = grammar::CommandRegistry::WithBuiltins();
  for (const auto& [name, spec] : cfg.additionalCommands) {
    registry.add(name, spec);
  }
  return registry;
}

} // namespace cmfmt::config
