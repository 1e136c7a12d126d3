#pragma once

namespace puretop::ast {

enum class BinaryOperator {
    Add,
    Sub,
    Mul,
    Div,
    Mod,
    Pow,
    LShift,
    RShift,
    URShift,
    BitAnd,
    BitOr,
    BitXor,
    Eq,
    Ne,
    StrictEq,
    StrictNe,
    Lt,
    Le,
    Gt,
    Ge,
    In,
    InstanceOf,
    And,
    Or,
    Nullish
};

// Source lexeme for the operator (e.g. "===", "instanceof")
const char* to_string(BinaryOperator op);

} // namespace puretop::ast
