/**
 * @file
 * @brief AST try/catch/finally. `handler` or `finalizer` is present, or both.
 */
#pragma once

#include <memory>
#include "ast/Acceptable.h"
#include "ast/BlockStmt.h"
#include "ast/Expr.h"
#include "ast/Stmt.h"

namespace puretop::ast {

struct TryStmt final : Stmt, Acceptable<TryStmt, NodeKind::TryStmt> {
  std::unique_ptr<BlockStmt> block;
  std::unique_ptr<Expr> param;          // catch binding; null for `catch {` and when absent
  std::unique_ptr<BlockStmt> handler;   // catch block
  std::unique_ptr<BlockStmt> finalizer;
  TryStmt() : Stmt(NodeKind::TryStmt) {}
};

} // namespace puretop::ast
