/**
 * @file
 * @brief AST `for (left in right)` and `for [await] (left of right)` loops.
 */
#pragma once

#include <memory>
#include "ast/Stmt.h"
#include "ast/Expr.h"
#include "ast/Acceptable.h"

namespace puretop::ast {

enum class ForInKind { In, Of };

struct ForInStmt final : Stmt, Acceptable<ForInStmt, NodeKind::ForInStmt> {
  ForInKind loopKind{ForInKind::In};
  bool isAwait{false};
  std::unique_ptr<Node> left; // VarDecl or assignment target
  std::unique_ptr<Expr> right;
  std::unique_ptr<Stmt> body;
  ForInStmt() : Stmt(NodeKind::ForInStmt) {}
};

} // namespace puretop::ast
