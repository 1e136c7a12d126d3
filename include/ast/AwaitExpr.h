/**
 * @file
 * @brief AST declarations.
 */
#pragma once

#include <memory>
#include <utility>
#include "ast/Expr.h"
#include "ast/Acceptable.h"

namespace puretop::ast {

struct AwaitExpr final : Expr, Acceptable<AwaitExpr, NodeKind::AwaitExpr> {
  std::unique_ptr<Expr> argument;
  explicit AwaitExpr(std::unique_ptr<Expr> a) : Expr(NodeKind::AwaitExpr), argument(std::move(a)) {}
};

} // namespace puretop::ast
