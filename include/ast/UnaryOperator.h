/**
 * @file
 * @brief AST unary operator enumeration.
 */
#pragma once

namespace puretop::ast {

enum class UnaryOperator {
    Neg,
    Plus,
    Not,
    BitNot,
    TypeOf,
    Void,
    Delete
};

const char* to_string(UnaryOperator op);

} // namespace puretop::ast
