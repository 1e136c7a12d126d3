#pragma once
#include <memory>
#include <utility>
#include <vector>

#include "Expr.h"
#include "ast/Acceptable.h"

namespace puretop::ast {

    struct NewExpr final : Expr, Acceptable<NewExpr, NodeKind::NewExpr> {
        std::unique_ptr<Expr> callee;
        std::vector<std::unique_ptr<Expr>> args;
        bool hasArgList{false}; // false for `new Foo`
        explicit NewExpr(std::unique_ptr<Expr> c) : Expr(NodeKind::NewExpr), callee(std::move(c)) {}
    };

} // namespace puretop::ast
