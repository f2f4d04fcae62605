/***
 * Name: cmfmt::config::Configuration
 * Purpose: Formatter options, custom command declarations and per-command
 *   overrides.
 * Inputs:
 *   - Defaults below, then values applied through set() by the loader
 * Outputs:
 *   - Typed fields; get()/resolveForCommand() expose them by config key
 * Theory of Operation:
 *   Every option is described once in ConfigFields() (key, doc, choices,
 *   accessor pair). The loader, the writer and per-command resolution all go
 *   through that table, so a key is either known everywhere or nowhere.
 */
#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "config/ConfigLiteral.h"
#include "diag/DiagnosticSink.h"
#include "grammar/ArgSpec.h"

namespace cmfmt::config {

enum class LineEnding { Unix, Windows, Auto };
enum class CommandCase { Lower, Upper, Canonical, Unchanged };
enum class KeywordCase { Lower, Upper, Unchanged };

const char* to_string(LineEnding v);
const char* to_string(CommandCase v);
const char* to_string(KeywordCase v);

inline constexpr const char* kDefaultFencePattern = R"(^\s*([`~]{3}[`~]*)(.*)$)";
inline constexpr const char* kDefaultRulerPattern = R"(^\s*[^\w\s]{3}.*[^\w\s]{3}$)";

class Configuration {
 public:
  Configuration();

  int lineWidth{80};
  int tabSize{2};
  int maxSubargsPerLine{3};
  bool separateCtrlNameWithSpace{false};
  bool separateFnNameWithSpace{false};
  bool dangleParens{false};
  std::string bulletChar{"*"};
  std::string enumChar{"."};
  LineEnding lineEnding{LineEnding::Unix};
  CommandCase commandCase{CommandCase::Canonical};
  KeywordCase keywordCase{KeywordCase::Unchanged};
  std::vector<std::string> alwaysWrap{};
  std::vector<int> algorithmOrder{0, 1, 2, 3, 4};
  bool autosort{true};
  bool enableMarkup{true};
  bool firstCommentIsLiteral{false};
  std::optional<std::string> literalCommentPattern{};
  std::string fencePattern{kDefaultFencePattern};
  std::string rulerPattern{kDefaultRulerPattern};
  bool emitByteorderMark{false};
  int hashrulerMinLength{10};
  bool canonicalizeHashrulers{true};
  std::string inputEncoding{"utf-8"};
  std::string outputEncoding{"utf-8"};

  // Custom command grammars keyed by folded command name
  std::map<std::string, grammar::ArgSpec> additionalCommands{};
  // Folded command name -> config key -> override
  std::map<std::string, std::map<std::string, ConfigLiteral>> perCommand{};

  // Line terminator for the configured (or detected) line ending
  const std::string& endl() const;
  // `detected` must be Unix or Windows
  void setLineEnding(LineEnding detected);

  // Value of `key` by config name; throws ConfigError for unknown keys
  ConfigLiteral get(std::string_view key) const;
  // Validate and store; throws ConfigError on type or choice mismatch
  void set(std::string_view key, const ConfigLiteral& value, diag::DiagnosticSink& sink,
           const lex::SourceLocation& where = {});
  ConfigLiteral resolveForCommand(std::string_view command, std::string_view key) const;

  void declareCommand(std::string_view name, const ConfigLiteral& decl);
  void overrideCommand(std::string_view name, std::string_view key, const ConfigLiteral& value,
                       diag::DiagnosticSink& sink, const lex::SourceLocation& where = {});

 private:
  std::optional<LineEnding> detected_{};
};

struct FieldInfo {
  const char* name;
  const char* doc;
  std::vector<std::string> choices;
  ConfigLiteral (*get)(const Configuration&);
  void (*set)(Configuration&, const ConfigLiteral&, diag::DiagnosticSink&, const lex::SourceLocation&);
};

// Scalar and list options in file order (additional_commands/per_command are
// handled by the Configuration members directly)
const std::vector<FieldInfo>& ConfigFields();
const FieldInfo* FindField(std::string_view name);

// Grammar described by an additional_commands entry (dict or bare arity)
grammar::ArgSpec CommandSpecFromLiteral(const ConfigLiteral& decl, std::string_view context);
ConfigLiteral CommandSpecToLiteral(const grammar::ArgSpec& spec);

} // namespace cmfmt::config
