/***
 * Name: cmfmt::lint::Linter (impl)
 */
#include "lint/Linter.h"

#include <map>
#include <string>

#include "diag/DiagnosticIds.h"
#include "lint/CheckRequiredKwargs.h"

namespace cmfmt::lint {

std::size_t Linter::run(const cst::Node& body) {
  const std::size_t before = sink_.size();
  visit(body);
  return sink_.size() - before;
}

void Linter::visit(const cst::Node& node) {
  if (node.kind == cst::NodeKind::Statement) {
    checkStatement(node);
    return;
  }
  if (node.kind == cst::NodeKind::Body || node.kind == cst::NodeKind::FlowControl) {
    for (const auto* child : node.childNodes()) { visit(*child); }
  }
}

void Linter::checkStatement(const cst::Node& statement) {
  const auto& spec = registry_.lookup(statement.command());
  if (spec.required.empty()) { return; }
  const auto* args = statement.arguments();
  if (args == nullptr || args->kind != cst::NodeKind::ArgGroup) { return; }
  std::map<std::string, std::string> required;
  for (const auto& kw : spec.required) {
    required.emplace(kw, std::string(diag::kMissingRequiredKwarg));
  }
  CheckRequiredKwargs(*args, sink_, required);
}

} // namespace cmfmt::lint
