#pragma once

#include "ast/Expr.h"
#include "ast/Acceptable.h"

namespace puretop::ast {
    struct SuperExpr final : Expr, Acceptable<SuperExpr, NodeKind::SuperExpr> {
        SuperExpr() : Expr(NodeKind::SuperExpr) {}
    };
}
