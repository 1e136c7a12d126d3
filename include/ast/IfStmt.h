/**
 * @file
 * @brief AST declarations.
 */
#pragma once

#include <memory>
#include "ast/Stmt.h"
#include "ast/Expr.h"
#include "ast/Acceptable.h"

namespace puretop::ast {

struct IfStmt final : Stmt, Acceptable<IfStmt, NodeKind::IfStmt> {
  std::unique_ptr<Expr> cond;
  std::unique_ptr<Stmt> consequent;
  std::unique_ptr<Stmt> alternate; // may be null
  IfStmt() : Stmt(NodeKind::IfStmt) {}
};

} // namespace puretop::ast
