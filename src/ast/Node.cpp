/**
 * @file
 * @brief AST base Node default accept implementation.
 */
/***
 * Name: puretop::ast::Node::accept
 * Purpose: Dynamic dispatch via the central switch.
 */
#include "ast/Node.h"
#include "ast/Visitor.h"

namespace puretop::ast {

void Node::accept(VisitorBase& visitor) const {
    dispatch(*this, visitor);
}

} // namespace puretop::ast
