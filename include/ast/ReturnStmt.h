/**
 * @file
 * @brief AST return statement declarations.
 */
#pragma once

#include <memory>
#include <utility>
#include "ast/Stmt.h"
#include "ast/Expr.h"
#include "ast/Acceptable.h"

namespace puretop::ast {
    struct ReturnStmt final : Stmt, Acceptable<ReturnStmt, NodeKind::ReturnStmt> {
        std::unique_ptr<Expr> value; // may be null
        explicit ReturnStmt(std::unique_ptr<Expr> v) : Stmt(NodeKind::ReturnStmt), value(std::move(v)) {}
    };
} // namespace puretop::ast
