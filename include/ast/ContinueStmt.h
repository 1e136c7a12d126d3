#pragma once

#include <string>
#include "ast/Stmt.h"
#include "ast/Acceptable.h"

namespace puretop::ast {
    struct ContinueStmt final : Stmt, Acceptable<ContinueStmt, NodeKind::ContinueStmt> {
        std::string label;
        ContinueStmt() : Stmt(NodeKind::ContinueStmt) {}
    };
}
