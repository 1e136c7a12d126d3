/**
 * @file
 * @brief AST object literal (also used for object destructuring patterns).
 */
#pragma once

#include <memory>
#include <vector>
#include "ast/Expr.h"
#include "ast/Property.h"
#include "ast/Acceptable.h"

namespace puretop::ast {

struct ObjectLiteral final : Expr, Acceptable<ObjectLiteral, NodeKind::ObjectLiteral> {
  std::vector<std::unique_ptr<Property>> properties;
  ObjectLiteral() : Expr(NodeKind::ObjectLiteral) {}
};

} // namespace puretop::ast
