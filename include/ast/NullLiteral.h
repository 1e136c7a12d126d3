#pragma once

#include "ast/Expr.h"
#include "ast/Acceptable.h"

namespace puretop::ast {
    struct NullLiteral final : Expr, Acceptable<NullLiteral, NodeKind::NullLiteral> {
        NullLiteral() : Expr(NodeKind::NullLiteral) {}
    };
}
