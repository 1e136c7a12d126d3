#pragma once

#include "ast/Stmt.h"
#include "ast/Acceptable.h"

namespace puretop::ast {
    struct DebuggerStmt final : Stmt, Acceptable<DebuggerStmt, NodeKind::DebuggerStmt> {
        DebuggerStmt() : Stmt(NodeKind::DebuggerStmt) {}
    };
}
