#pragma once

#include <memory>
#include "ast/Stmt.h"
#include "ast/Expr.h"
#include "ast/Acceptable.h"

namespace puretop::ast {

struct DoWhileStmt final : Stmt, Acceptable<DoWhileStmt, NodeKind::DoWhileStmt> {
  std::unique_ptr<Stmt> body;
  std::unique_ptr<Expr> cond;
  DoWhileStmt() : Stmt(NodeKind::DoWhileStmt) {}
};

} // namespace puretop::ast
