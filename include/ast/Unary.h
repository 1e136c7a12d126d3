#pragma once
#include <memory>
#include <utility>
#include "Expr.h"
#include "UnaryOperator.h"
#include "ast/Acceptable.h"

namespace puretop::ast {
    struct Unary final : Expr, Acceptable<Unary, NodeKind::UnaryExpr> {
        UnaryOperator op;
        std::unique_ptr<Expr> operand;
        Unary(const UnaryOperator o, std::unique_ptr<Expr> e)
            : Expr(NodeKind::UnaryExpr), op(o), operand(std::move(e)) {}
    };
} // namespace puretop::ast
