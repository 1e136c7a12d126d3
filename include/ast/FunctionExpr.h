/**
 * @file
 * @brief AST function expression (also the value of object/class methods).
 */
#pragma once

#include <memory>
#include "ast/Acceptable.h"
#include "ast/Expr.h"
#include "ast/HasBody.h"
#include "ast/HasFunctionFlags.h"
#include "ast/HasName.h"
#include "ast/HasParams.h"
#include "ast/Stmt.h"

namespace puretop::ast {
    struct FunctionExpr final : Expr, Acceptable<FunctionExpr, NodeKind::FunctionExpr>, HasName,
                                HasParams<std::unique_ptr<Expr>>, HasBody<Stmt>, HasFunctionFlags {
        FunctionExpr() : Expr(NodeKind::FunctionExpr) {}
    };
} // namespace puretop::ast
