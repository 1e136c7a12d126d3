#pragma once

#include "ast/Acceptable.h"
#include "ast/Expr.h"
#include "ast/HasClassBody.h"
#include "ast/HasName.h"

namespace puretop::ast {
    struct ClassExpr final : Expr, Acceptable<ClassExpr, NodeKind::ClassExpr>, HasName, HasClassBody {
        ClassExpr() : Expr(NodeKind::ClassExpr) {}
    };
}
