/**
 * @file
 * @brief AST dynamic import, `import(specifier[, options])`. Not a call-like node.
 */
#pragma once
#include <memory>
#include <vector>
#include "Expr.h"
#include "ast/Acceptable.h"

namespace puretop::ast {
    struct ImportCall final : Expr, Acceptable<ImportCall, NodeKind::ImportCall> {
        std::vector<std::unique_ptr<Expr>> args;
        ImportCall() : Expr(NodeKind::ImportCall) {}
    };
} // namespace puretop::ast
