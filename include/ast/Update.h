#pragma once
#include <memory>
#include <string>
#include <utility>
#include "Expr.h"
#include "ast/Acceptable.h"

namespace puretop::ast {
    struct Update final : Expr, Acceptable<Update, NodeKind::UpdateExpr> {
        std::string op; // "++" or "--"
        bool prefix{false};
        std::unique_ptr<Expr> operand;
        Update(std::string o, const bool pre, std::unique_ptr<Expr> e)
            : Expr(NodeKind::UpdateExpr), op(std::move(o)), prefix(pre), operand(std::move(e)) {}
    };
} // namespace puretop::ast
