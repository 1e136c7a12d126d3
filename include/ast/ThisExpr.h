#pragma once

#include "ast/Expr.h"
#include "ast/Acceptable.h"

namespace puretop::ast {
    struct ThisExpr final : Expr, Acceptable<ThisExpr, NodeKind::ThisExpr> {
        ThisExpr() : Expr(NodeKind::ThisExpr) {}
    };
}
