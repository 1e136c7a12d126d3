/**
 * @file
 * @brief Size summary of a parsed module for metrics.
 */
#pragma once

#include <cstdint>
#include "ast/Module.h"

namespace puretop::ast {
    // Node count and nesting depth of the tree, plus its comment store size
    struct GeometrySummary {
        uint64_t nodes{0};
        uint64_t maxDepth{0};
        uint64_t comments{0};
        uint64_t pureMarkers{0}; // synthesized by passes so far
    };

    GeometrySummary ComputeGeometry(const Module& module);

} // namespace puretop::ast
