/***
 * Name: puretop::ast::ClassMember
 * Purpose: One element of a class body.
 * Theory of Operation:
 *   Methods, getters, setters and constructors carry a FunctionExpr in
 *   `value`; fields carry their optional initializer in `value`; static
 *   initialization blocks keep their statements in `body`.
 */
#pragma once

#include <memory>
#include "ast/Acceptable.h"
#include "ast/Expr.h"
#include "ast/HasBody.h"
#include "ast/Node.h"
#include "ast/Stmt.h"

namespace puretop::ast {

enum class ClassMemberKind { Constructor, Method, Getter, Setter, Field, StaticBlock };

struct ClassMember final : Node, Acceptable<ClassMember, NodeKind::ClassMember>, HasBody<Stmt> {
  ClassMemberKind memberKind{ClassMemberKind::Method};
  bool isStatic{false};
  bool computed{false};
  std::unique_ptr<Expr> key;
  std::unique_ptr<Expr> value;
  ClassMember() : Node(NodeKind::ClassMember) {}
};

} // namespace puretop::ast
