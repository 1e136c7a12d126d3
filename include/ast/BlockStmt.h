#pragma once

#include "ast/Acceptable.h"
#include "ast/HasBody.h"
#include "ast/Stmt.h"

namespace puretop::ast {
    struct BlockStmt final : Stmt, Acceptable<BlockStmt, NodeKind::BlockStmt>, HasBody<Stmt> {
        BlockStmt() : Stmt(NodeKind::BlockStmt) {}
    };
}
