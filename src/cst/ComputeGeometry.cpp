/***
 * Name: cmfmt::cst::ComputeGeometry
 * Purpose: Compute CST geometry (node count and maximum depth) via DFS.
 * Inputs:
 *   - root: CST root node
 * Outputs:
 *   - node count and maximum nesting depth (root is depth 1)
 */
#include <algorithm>

#include "cst/GeometrySummary.h"

namespace cmfmt::cst {

static void DepthFirstAccumulate(const Node& node, const uint64_t depth, GeometrySummary& out) {
  out.maxDepth = std::max(depth, out.maxDepth);
  ++out.nodes;
  for (const auto* child : node.childNodes()) {
    DepthFirstAccumulate(*child, depth + 1, out);
  }
}

GeometrySummary ComputeGeometry(const Node& root) {
  GeometrySummary out{};
  constexpr uint64_t kInitialDepth = 1U;
  DepthFirstAccumulate(root, kInitialDepth, out);
  return out;
}

} // namespace cmfmt::cst
