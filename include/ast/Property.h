/***
 * Name: puretop::ast::Property
 * Purpose: One entry of an object literal or object destructuring pattern.
 * Theory of Operation:
 *   Init: `key: value`; Shorthand: `key` (value is a Name, or an AssignExpr
 *   when a pattern default is present); Method/Getter/Setter: value is a
 *   FunctionExpr; Spread: `...value` with no key.
 */
#pragma once

#include <memory>
#include "ast/Expr.h"
#include "ast/Node.h"
#include "ast/Acceptable.h"

namespace puretop::ast {

enum class PropertyKind { Init, Shorthand, Method, Getter, Setter, Spread };

struct Property final : Node, Acceptable<Property, NodeKind::Property> {
  PropertyKind propKind{PropertyKind::Init};
  bool computed{false};
  std::unique_ptr<Expr> key;
  std::unique_ptr<Expr> value;
  Property() : Node(NodeKind::Property) {}
};

} // namespace puretop::ast
