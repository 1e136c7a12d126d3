#pragma once

#include <memory>
#include <utility>
#include "ast/Stmt.h"
#include "ast/Expr.h"
#include "ast/Acceptable.h"

namespace puretop::ast {
    struct ThrowStmt final : Stmt, Acceptable<ThrowStmt, NodeKind::ThrowStmt> {
        std::unique_ptr<Expr> value;
        explicit ThrowStmt(std::unique_ptr<Expr> v) : Stmt(NodeKind::ThrowStmt), value(std::move(v)) {}
    };
} // namespace puretop::ast
