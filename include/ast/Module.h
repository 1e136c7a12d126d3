/**
 * @file
 * @brief AST module node declarations.
 */
#pragma once

#include "ast/Acceptable.h"
#include "ast/HasBody.h"
#include "ast/Node.h"
#include "ast/SourceComments.h"
#include "ast/Stmt.h"

namespace puretop::ast {
    struct Module final : Node, HasBody<Stmt>, Acceptable<Module, NodeKind::Module> {
        // Leading comments keyed by source position (source comments and pass annotations)
        SourceComments comments;
        Module() : Node(NodeKind::Module) {}
    };
} // namespace puretop::ast
