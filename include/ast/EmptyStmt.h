#pragma once

#include "ast/Stmt.h"
#include "ast/Acceptable.h"

namespace puretop::ast {
    struct EmptyStmt final : Stmt, Acceptable<EmptyStmt, NodeKind::EmptyStmt> {
        EmptyStmt() : Stmt(NodeKind::EmptyStmt) {}
    };
}
