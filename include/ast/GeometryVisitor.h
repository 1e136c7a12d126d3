/**
 * @file
 * @brief AST geometry visitor declarations.
 */
#pragma once

#include <cstdint>
#include "ast/AstWalker.h"

namespace puretop::ast {

// Counts nodes and tracks the deepest nesting level reached by the walk
struct GeometryVisitor final : public AstWalker {
  uint64_t nodes{0};
  uint64_t maxDepth{0};
  uint64_t depth{0};

  void bump();

 protected:
  void enter(const Node& n) override;
  void leave(const Node& n) override;
};

} // namespace puretop::ast
