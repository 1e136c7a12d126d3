/**
 * @file
 * @brief AST identifier reference declarations.
 */
#pragma once
#include <string>
#include <utility>
#include "Expr.h"
#include "ast/Acceptable.h"

namespace puretop::ast {

    struct Name final : Expr, Acceptable<Name, NodeKind::Name> {
        std::string id;
        explicit Name(std::string s) : Expr(NodeKind::Name), id(std::move(s)) {}
    };

} // namespace puretop::ast
