#pragma once
#include <memory>
#include <utility>
#include "Expr.h"
#include "ast/Acceptable.h"

namespace puretop::ast {
    struct ParenExpr final : Expr, Acceptable<ParenExpr, NodeKind::ParenExpr> {
        std::unique_ptr<Expr> expr;
        explicit ParenExpr(std::unique_ptr<Expr> e) : Expr(NodeKind::ParenExpr), expr(std::move(e)) {}
    };
} // namespace puretop::ast
