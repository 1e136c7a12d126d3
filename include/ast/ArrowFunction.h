/**
 * @file
 * @brief AST arrow function; either `exprBody` is set or statements live in `body`.
 */
#pragma once

#include <memory>
#include "ast/Acceptable.h"
#include "ast/Expr.h"
#include "ast/HasBody.h"
#include "ast/HasParams.h"
#include "ast/Stmt.h"

namespace puretop::ast {

struct ArrowFunction final : Expr, Acceptable<ArrowFunction, NodeKind::ArrowFunction>,
                             HasParams<std::unique_ptr<Expr>>, HasBody<Stmt> {
  std::unique_ptr<Expr> exprBody;
  bool isAsync{false};
  ArrowFunction() : Expr(NodeKind::ArrowFunction) {}
};

} // namespace puretop::ast
