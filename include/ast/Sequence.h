#pragma once
#include <memory>
#include <vector>
#include "Expr.h"
#include "ast/Acceptable.h"

namespace puretop::ast {
    struct Sequence final : Expr, Acceptable<Sequence, NodeKind::Sequence> {
        std::vector<std::unique_ptr<Expr>> exprs;
        Sequence() : Expr(NodeKind::Sequence) {}
    };
} // namespace puretop::ast
