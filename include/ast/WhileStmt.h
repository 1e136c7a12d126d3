#pragma once

#include <memory>
#include "ast/Stmt.h"
#include "ast/Expr.h"
#include "ast/Acceptable.h"

namespace puretop::ast {

struct WhileStmt final : Stmt, Acceptable<WhileStmt, NodeKind::WhileStmt> {
  std::unique_ptr<Expr> cond;
  std::unique_ptr<Stmt> body;
  WhileStmt() : Stmt(NodeKind::WhileStmt) {}
};

} // namespace puretop::ast
