/***
 * Name: cmfmt::grammar::CommandRegistry (impl)
 */
#include "grammar/CommandRegistry.h"

#include "cmfmt/support/case.h"

namespace cmfmt::grammar {

CommandRegistry::CommandRegistry() : fallback_(Standard(NArgs::ZeroOrMore())) {}

CommandRegistry CommandRegistry::WithBuiltins() {
  CommandRegistry registry;
  RegisterBuiltinCommands(registry);
  return registry;
}

void CommandRegistry::add(const std::string_view name, ArgSpec spec) {
  specs_.insert_or_assign(support::FoldCase(name), std::move(spec));
}

const ArgSpec& CommandRegistry::lookup(const std::string_view name) const {
  const auto it = specs_.find(support::FoldCase(name));
  return it == specs_.end() ? fallback_ : it->second;
}

bool CommandRegistry::contains(const std::string_view name) const {
  return specs_.contains(support::FoldCase(name));
}

} // namespace cmfmt::grammar
