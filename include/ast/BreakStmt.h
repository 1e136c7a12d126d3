#pragma once

#include <string>
#include "ast/Stmt.h"
#include "ast/Acceptable.h"

namespace puretop::ast {
    struct BreakStmt final : Stmt, Acceptable<BreakStmt, NodeKind::BreakStmt> {
        std::string label;
        BreakStmt() : Stmt(NodeKind::BreakStmt) {}
    };
}
