/***
 * Name: cmfmt::grammar::CommandRegistry
 * Purpose: Map command names to grammar descriptors.
 * Inputs:
 *   - Built-in table (WithBuiltins) and caller-supplied overrides (add)
 * Outputs:
 *   - lookup(name): descriptor for the command, or the generic fallback
 * Theory of Operation:
 *   Names are case-folded on insert and lookup. An unknown command is not an
 *   error: it parses as "standard, * positional, no keywords, no flags". The
 *   parser only reads the registry.
 */
#pragma once

#include <map>
#include <string>
#include <string_view>

#include "grammar/ArgSpec.h"

namespace cmfmt::grammar {

class CommandRegistry {
 public:
  CommandRegistry();

  static CommandRegistry WithBuiltins();

  // Insert or replace the grammar for `name`
  void add(std::string_view name, ArgSpec spec);

  const ArgSpec& lookup(std::string_view name) const;
  bool contains(std::string_view name) const;
  std::size_t size() const { return specs_.size(); }
  const std::map<std::string, ArgSpec>& entries() const { return specs_; }

 private:
  std::map<std::string, ArgSpec> specs_{};
  ArgSpec fallback_{};
};

// Built-in command table (control flow plus common project commands)
void RegisterBuiltinCommands(CommandRegistry& registry);

} // namespace cmfmt::grammar
