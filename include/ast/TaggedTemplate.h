#pragma once

#include <memory>
#include <utility>
#include "ast/Expr.h"
#include "ast/TemplateLiteral.h"
#include "ast/Acceptable.h"

namespace puretop::ast {

struct TaggedTemplate final : Expr, Acceptable<TaggedTemplate, NodeKind::TaggedTemplate> {
  std::unique_ptr<Expr> tag;
  std::unique_ptr<TemplateLiteral> quasi;
  TaggedTemplate(std::unique_ptr<Expr> t, std::unique_ptr<TemplateLiteral> q)
      : Expr(NodeKind::TaggedTemplate), tag(std::move(t)), quasi(std::move(q)) {}
};

} // namespace puretop::ast
