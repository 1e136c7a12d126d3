/**
 * @file
 * @brief AST private class member name (`#field`).
 */
#pragma once
#include <string>
#include <utility>
#include "Expr.h"
#include "ast/Acceptable.h"

namespace puretop::ast {

    struct PrivateName final : Expr, Acceptable<PrivateName, NodeKind::PrivateName> {
        std::string id; // without the leading '#'
        explicit PrivateName(std::string s) : Expr(NodeKind::PrivateName), id(std::move(s)) {}
    };

} // namespace puretop::ast
