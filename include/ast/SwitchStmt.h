#pragma once

#include <memory>
#include <vector>
#include "ast/Acceptable.h"
#include "ast/Expr.h"
#include "ast/Stmt.h"

namespace puretop::ast {

struct SwitchCase {
  std::unique_ptr<Expr> test; // null for `default:`
  std::vector<std::unique_ptr<Stmt>> body;
};

struct SwitchStmt final : Stmt, Acceptable<SwitchStmt, NodeKind::SwitchStmt> {
  std::unique_ptr<Expr> discriminant;
  std::vector<SwitchCase> cases;
  SwitchStmt() : Stmt(NodeKind::SwitchStmt) {}
};

} // namespace puretop::ast
