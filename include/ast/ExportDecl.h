/**
 * @file
 * @brief AST export declarations (named, default, star).
 */
#pragma once

#include <memory>
#include <string>
#include <vector>
#include "ast/Acceptable.h"
#include "ast/Node.h"
#include "ast/Stmt.h"

namespace puretop::ast {

struct ExportSpecifier {
  std::string local;
  std::string exported;
};

struct ExportNamedDecl final : Stmt, Acceptable<ExportNamedDecl, NodeKind::ExportNamedDecl> {
  std::unique_ptr<Stmt> declaration;          // `export const x = ...`
  std::vector<ExportSpecifier> specifiers;    // `export { a as b }`
  std::string source;                         // re-export module; empty when local
  ExportNamedDecl() : Stmt(NodeKind::ExportNamedDecl) {}
};

struct ExportDefaultDecl final : Stmt, Acceptable<ExportDefaultDecl, NodeKind::ExportDefaultDecl> {
  std::unique_ptr<Node> declaration; // FunctionDecl, ClassDecl or Expr
  ExportDefaultDecl() : Stmt(NodeKind::ExportDefaultDecl) {}
};

struct ExportAllDecl final : Stmt, Acceptable<ExportAllDecl, NodeKind::ExportAllDecl> {
  std::string exported; // `export * as ns`; empty for plain `export *`
  std::string source;
  ExportAllDecl() : Stmt(NodeKind::ExportAllDecl) {}
};

} // namespace puretop::ast
