/**
 * @file
 * @brief Source lexemes for binary and unary operators.
 */
#include "ast/BinaryOperator.h"
#include "ast/UnaryOperator.h"

namespace puretop::ast {

const char* to_string(const BinaryOperator op) {
    switch (op) {
        case BinaryOperator::Add: return "+";
        case BinaryOperator::Sub: return "-";
        case BinaryOperator::Mul: return "*";
        case BinaryOperator::Div: return "/";
        case BinaryOperator::Mod: return "%";
        case BinaryOperator::Pow: return "**";
        case BinaryOperator::LShift: return "<<";
        case BinaryOperator::RShift: return ">>";
        case BinaryOperator::URShift: return ">>>";
        case BinaryOperator::BitAnd: return "&";
        case BinaryOperator::BitOr: return "|";
        case BinaryOperator::BitXor: return "^";
        case BinaryOperator::Eq: return "==";
        case BinaryOperator::Ne: return "!=";
        case BinaryOperator::StrictEq: return "===";
        case BinaryOperator::StrictNe: return "!==";
        case BinaryOperator::Lt: return "<";
        case BinaryOperator::Le: return "<=";
        case BinaryOperator::Gt: return ">";
        case BinaryOperator::Ge: return ">=";
        case BinaryOperator::In: return "in";
        case BinaryOperator::InstanceOf: return "instanceof";
        case BinaryOperator::And: return "&&";
        case BinaryOperator::Or: return "||";
        case BinaryOperator::Nullish: return "??";
    }
    return "?";
}

const char* to_string(const UnaryOperator op) {
    switch (op) {
        case UnaryOperator::Neg: return "-";
        case UnaryOperator::Plus: return "+";
        case UnaryOperator::Not: return "!";
        case UnaryOperator::BitNot: return "~";
        case UnaryOperator::TypeOf: return "typeof";
        case UnaryOperator::Void: return "void";
        case UnaryOperator::Delete: return "delete";
    }
    return "?";
}

} // namespace puretop::ast
