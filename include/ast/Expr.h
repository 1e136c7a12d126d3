/**
 * @file
 * @brief AST expression base declarations.
 */
#pragma once

#include "Node.h"

namespace puretop::ast {
    struct Expr : Node {
        using Node::Node;
    };
} // namespace puretop::ast
