/**
 * @file
 * @brief AST template literal; quasis.size() == exprs.size() + 1.
 */
#pragma once

#include <memory>
#include <string>
#include <vector>
#include "ast/Expr.h"
#include "ast/Acceptable.h"

namespace puretop::ast {

struct TemplateLiteral final : Expr, Acceptable<TemplateLiteral, NodeKind::TemplateLiteral> {
  std::vector<std::string> quasis;            // raw text between substitutions
  std::vector<std::unique_ptr<Expr>> exprs;   // ${...} substitutions
  TemplateLiteral() : Expr(NodeKind::TemplateLiteral) {}
};

} // namespace puretop::ast
