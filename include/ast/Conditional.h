#pragma once
#include <memory>
#include "Expr.h"
#include "ast/Acceptable.h"

namespace puretop::ast {
    struct Conditional final : Expr, Acceptable<Conditional, NodeKind::Conditional> {
        std::unique_ptr<Expr> test;
        std::unique_ptr<Expr> consequent;
        std::unique_ptr<Expr> alternate;
        Conditional() : Expr(NodeKind::Conditional) {}
    };
} // namespace puretop::ast
