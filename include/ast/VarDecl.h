/**
 * @file
 * @brief AST `var` / `let` / `const` declarations.
 */
#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>
#include "ast/Acceptable.h"
#include "ast/Expr.h"
#include "ast/Stmt.h"

namespace puretop::ast {

struct VarDeclarator {
  std::unique_ptr<Expr> target; // Name or destructuring pattern
  std::unique_ptr<Expr> init;   // may be null
};

struct VarDecl final : Stmt, Acceptable<VarDecl, NodeKind::VarDecl> {
  std::string declKind; // "var", "let" or "const"
  std::vector<VarDeclarator> declarations;
  explicit VarDecl(std::string k) : Stmt(NodeKind::VarDecl), declKind(std::move(k)) {}
};

} // namespace puretop::ast
