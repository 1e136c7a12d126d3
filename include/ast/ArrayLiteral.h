/**
 * @file
 * @brief AST array literal (also used for array destructuring patterns).
 */
#pragma once

#include <memory>
#include <vector>
#include "ast/Expr.h"
#include "ast/Acceptable.h"

namespace puretop::ast {

struct ArrayLiteral final : Expr, Acceptable<ArrayLiteral, NodeKind::ArrayLiteral> {
  std::vector<std::unique_ptr<Expr>> elements; // nullptr marks a hole
  ArrayLiteral() : Expr(NodeKind::ArrayLiteral) {}
};

} // namespace puretop::ast
