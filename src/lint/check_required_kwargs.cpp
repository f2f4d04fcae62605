/***
 * Name: cmfmt::lint::CheckRequiredKwargs (impl)
 */
#include "lint/CheckRequiredKwargs.h"

#include <algorithm>
#include <utility>
#include <vector>

#include "parser/ArgParsers.h"

namespace cmfmt::lint {

void CheckRequiredKwargs(const cst::Node& tree, diag::DiagnosticSink& sink,
                         std::map<std::string, std::string>& required) {
  for (const auto* group : tree.keywordGroups()) {
    const auto* keyword = group ? group->keyword() : nullptr;
    const auto* tok = keyword ? keyword->firstToken() : nullptr;
    if (tok == nullptr) { continue; }
    if (const auto word = parse::NormalizedWord(*tok)) { required.erase(*word); }
  }
  if (required.empty()) { return; }

  lex::SourceLocation where{};
  if (const auto* tok = tree.firstSemanticToken()) {
    where = tok->location();
  } else if (const auto* first = tree.firstToken()) {
    where = first->location();
  }

  std::vector<std::pair<std::string, std::string>> missing;
  for (const auto& [word, id] : required) { missing.emplace_back(id, word); }
  std::sort(missing.begin(), missing.end());
  for (const auto& [id, word] : missing) {
    sink.record(id, word, where);
  }
}

} // namespace cmfmt::lint
