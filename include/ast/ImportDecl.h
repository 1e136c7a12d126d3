/**
 * @file
 * @brief AST static import declarations.
 */
#pragma once

#include <string>
#include <vector>
#include "ast/Stmt.h"
#include "ast/Acceptable.h"

namespace puretop::ast {

enum class ImportKind { Default, Namespace, Named };

struct ImportSpecifier {
  ImportKind importKind{ImportKind::Named};
  std::string imported; // empty for default/namespace
  std::string local;
};

struct ImportDecl final : Stmt, Acceptable<ImportDecl, NodeKind::ImportDecl> {
  std::vector<ImportSpecifier> specifiers; // empty for `import "mod";`
  std::string source;                      // unquoted module specifier
  ImportDecl() : Stmt(NodeKind::ImportDecl) {}
};

} // namespace puretop::ast
