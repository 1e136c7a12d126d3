/**
 * @file
 * @brief AST spread element / rest element (`...expr`).
 */
#pragma once
#include <memory>
#include <utility>
#include "Expr.h"
#include "ast/Acceptable.h"

namespace puretop::ast {
    struct Spread final : Expr, Acceptable<Spread, NodeKind::Spread> {
        std::unique_ptr<Expr> argument;
        explicit Spread(std::unique_ptr<Expr> a) : Expr(NodeKind::Spread), argument(std::move(a)) {}
    };
} // namespace puretop::ast
