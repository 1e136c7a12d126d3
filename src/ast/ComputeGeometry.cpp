/***
 * Name: puretop::ast::ComputeGeometry
 * Purpose: Walk the module for node count and max depth; read comment totals from its store.
 */
#include "ast/GeometrySummary.h"
#include "ast/GeometryVisitor.h"

namespace puretop::ast {

GeometrySummary ComputeGeometry(const Module& module) {
  GeometryVisitor visitor;
  visitor.walk(&module);
  return GeometrySummary{visitor.nodes, visitor.maxDepth,
                         static_cast<uint64_t>(module.comments.size()),
                         static_cast<uint64_t>(module.comments.synthesizedCount())};
}

} // namespace puretop::ast
