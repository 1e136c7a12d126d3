/***
 * Name: puretop::ast::GeometryVisitor (impl)
 */
#include "ast/GeometryVisitor.h"
#include <algorithm>

namespace puretop::ast {

void GeometryVisitor::bump() { ++nodes; maxDepth = std::max(maxDepth, depth); }

void GeometryVisitor::enter(const Node&) {
  bump();
  ++depth;
}

void GeometryVisitor::leave(const Node&) { --depth; }

} // namespace puretop::ast
