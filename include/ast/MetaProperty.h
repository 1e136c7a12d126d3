/**
 * @file
 * @brief AST meta properties: `new.target`, `import.meta`.
 */
#pragma once
#include <string>
#include <utility>
#include "Expr.h"
#include "ast/Acceptable.h"

namespace puretop::ast {
    struct MetaProperty final : Expr, Acceptable<MetaProperty, NodeKind::MetaProperty> {
        std::string meta;
        std::string property;
        MetaProperty(std::string m, std::string p)
            : Expr(NodeKind::MetaProperty), meta(std::move(m)), property(std::move(p)) {}
    };
} // namespace puretop::ast
