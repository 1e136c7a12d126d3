/**
 * @file
 * @brief AST member access: `object.name`, `object[expr]`, `object.#priv`, `object?.name`.
 */
#pragma once

#include <memory>
#include <utility>
#include "ast/Expr.h"
#include "ast/Acceptable.h"

namespace puretop::ast {

struct Member final : Expr, Acceptable<Member, NodeKind::Member> {
  std::unique_ptr<Expr> object;
  std::unique_ptr<Expr> property; // Name or PrivateName unless computed
  bool computed{false};
  bool optional{false};
  Member(std::unique_ptr<Expr> o, std::unique_ptr<Expr> p)
      : Expr(NodeKind::Member), object(std::move(o)), property(std::move(p)) {}
};

} // namespace puretop::ast
