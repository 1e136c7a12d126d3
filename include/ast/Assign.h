/**
 * @file
 * @brief AST assignment (plain, compound and logical); targets may be patterns.
 */
#pragma once
#include <memory>
#include <string>
#include <utility>
#include "Expr.h"
#include "ast/Acceptable.h"

namespace puretop::ast {
    struct Assign final : Expr, Acceptable<Assign, NodeKind::AssignExpr> {
        std::string op; // "=", "+=", "??=", ...
        std::unique_ptr<Expr> target;
        std::unique_ptr<Expr> value;
        Assign(std::string o, std::unique_ptr<Expr> t, std::unique_ptr<Expr> v)
            : Expr(NodeKind::AssignExpr), op(std::move(o)), target(std::move(t)), value(std::move(v)) {}
    };
} // namespace puretop::ast
