/**
 * @file
 * @brief Literal aliases. Numeric, bigint and string literals keep their raw source text.
 */
#pragma once

#include <string>
#include "ast/Literal.h"

namespace puretop::ast {
    using NumberLiteral = Literal<std::string, NodeKind::NumberLiteral>;
    using BigIntLiteral = Literal<std::string, NodeKind::BigIntLiteral>;
    using StringLiteral = Literal<std::string, NodeKind::StringLiteral>;
    using BooleanLiteral = Literal<bool, NodeKind::BooleanLiteral>;
}
