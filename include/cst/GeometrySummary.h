/**
 * @file
 * @brief CST geometry summary declarations.
 */
#pragma once

#include <cstdint>
#include "cst/Node.h"

namespace cmfmt::cst {
    // Node count and maximum depth of a tree (tokens are not counted)
    struct GeometrySummary {
        uint64_t nodes{0};
        uint64_t maxDepth{0};
    };

    GeometrySummary ComputeGeometry(const Node& root);

} // namespace cmfmt::cst
