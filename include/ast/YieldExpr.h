/**
 * @file
 * @brief AST declarations.
 */
#pragma once

#include <memory>
#include "ast/Expr.h"
#include "ast/Acceptable.h"

namespace puretop::ast {

struct YieldExpr final : Expr, Acceptable<YieldExpr, NodeKind::YieldExpr> {
  std::unique_ptr<Expr> argument; // may be null
  bool delegate{false};           // yield*
  YieldExpr() : Expr(NodeKind::YieldExpr) {}
};

} // namespace puretop::ast
