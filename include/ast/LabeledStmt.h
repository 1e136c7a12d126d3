#pragma once

#include <memory>
#include <string>
#include "ast/Stmt.h"
#include "ast/Acceptable.h"

namespace puretop::ast {
    struct LabeledStmt final : Stmt, Acceptable<LabeledStmt, NodeKind::LabeledStmt> {
        std::string label;
        std::unique_ptr<Stmt> body;
        LabeledStmt() : Stmt(NodeKind::LabeledStmt) {}
    };
}
