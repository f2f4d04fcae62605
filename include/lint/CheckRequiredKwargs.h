/***
 * Name: cmfmt::lint::CheckRequiredKwargs
 * Purpose: Report required keywords missing from a standard argument tree.
 * Inputs:
 *   - tree: ARGGROUP node produced by the argument parsers
 *   - sink: receives one record per missing keyword
 *   - required: normalized keyword -> diagnostic id; found keywords are
 *     removed from it
 * Outputs:
 *   - Records sorted by (id, keyword), located at the first semantic token
 *     of the tree (or its first token when it has none)
 */
#pragma once

#include <map>
#include <string>

#include "cst/Node.h"
#include "diag/DiagnosticSink.h"

namespace cmfmt::lint {

void CheckRequiredKwargs(const cst::Node& tree, diag::DiagnosticSink& sink,
                         std::map<std::string, std::string>& required);

} // namespace cmfmt::lint
