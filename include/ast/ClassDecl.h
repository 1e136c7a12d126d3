#pragma once

#include "ast/Acceptable.h"
#include "ast/HasClassBody.h"
#include "ast/HasName.h"
#include "ast/Stmt.h"

namespace puretop::ast {
    struct ClassDecl final : Stmt, Acceptable<ClassDecl, NodeKind::ClassDecl>, HasName, HasClassBody {
        ClassDecl() : Stmt(NodeKind::ClassDecl) {}
    };
}
