#pragma once
#include <memory>
#include <utility>
#include <vector>

#include "Expr.h"
#include "ast/Acceptable.h"

namespace puretop::ast {

    struct Call final : Expr, Acceptable<Call, NodeKind::Call> {
        std::unique_ptr<Expr> callee;
        std::vector<std::unique_ptr<Expr>> args; // Spread entries for `...xs`
        bool optional{false};                    // `callee?.()`
        explicit Call(std::unique_ptr<Expr> c) : Expr(NodeKind::Call), callee(std::move(c)) {}
    };

} // namespace puretop::ast
