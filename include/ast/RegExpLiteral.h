#pragma once

#include <string>
#include <utility>
#include "ast/Expr.h"
#include "ast/Acceptable.h"

namespace puretop::ast {
    struct RegExpLiteral final : Expr, Acceptable<RegExpLiteral, NodeKind::RegExpLiteral> {
        std::string pattern;
        std::string flags;
        RegExpLiteral(std::string p, std::string f)
            : Expr(NodeKind::RegExpLiteral), pattern(std::move(p)), flags(std::move(f)) {}
    };
}
