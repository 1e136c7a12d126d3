/**
 * @file
 * @brief AST classic `for (init; test; update)` loop.
 */
#pragma once

#include <memory>
#include "ast/Stmt.h"
#include "ast/Expr.h"
#include "ast/Acceptable.h"

namespace puretop::ast {

struct ForStmt final : Stmt, Acceptable<ForStmt, NodeKind::ForStmt> {
  std::unique_ptr<Node> init; // VarDecl or Expr; may be null
  std::unique_ptr<Expr> test;
  std::unique_ptr<Expr> update;
  std::unique_ptr<Stmt> body;
  ForStmt() : Stmt(NodeKind::ForStmt) {}
};

} // namespace puretop::ast
