/**
 * @file
 * @brief NodeKind names for dumps and logs.
 */
#include "ast/NodeKind.h"

namespace puretop::ast {

const char* to_string(const NodeKind kind) {
    switch (kind) {
        case NodeKind::Module: return "Module";
        case NodeKind::VarDecl: return "VarDecl";
        case NodeKind::FunctionDecl: return "FunctionDecl";
        case NodeKind::ClassDecl: return "ClassDecl";
        case NodeKind::ExprStmt: return "ExprStmt";
        case NodeKind::BlockStmt: return "BlockStmt";
        case NodeKind::IfStmt: return "IfStmt";
        case NodeKind::ForStmt: return "ForStmt";
        case NodeKind::ForInStmt: return "ForInStmt";
        case NodeKind::WhileStmt: return "WhileStmt";
        case NodeKind::DoWhileStmt: return "DoWhileStmt";
        case NodeKind::ReturnStmt: return "ReturnStmt";
        case NodeKind::ThrowStmt: return "ThrowStmt";
        case NodeKind::TryStmt: return "TryStmt";
        case NodeKind::SwitchStmt: return "SwitchStmt";
        case NodeKind::BreakStmt: return "BreakStmt";
        case NodeKind::ContinueStmt: return "ContinueStmt";
        case NodeKind::LabeledStmt: return "LabeledStmt";
        case NodeKind::EmptyStmt: return "EmptyStmt";
        case NodeKind::DebuggerStmt: return "DebuggerStmt";
        case NodeKind::ImportDecl: return "ImportDecl";
        case NodeKind::ExportNamedDecl: return "ExportNamedDecl";
        case NodeKind::ExportDefaultDecl: return "ExportDefaultDecl";
        case NodeKind::ExportAllDecl: return "ExportAllDecl";
        case NodeKind::Name: return "Name";
        case NodeKind::PrivateName: return "PrivateName";
        case NodeKind::NumberLiteral: return "NumberLiteral";
        case NodeKind::BigIntLiteral: return "BigIntLiteral";
        case NodeKind::StringLiteral: return "StringLiteral";
        case NodeKind::BooleanLiteral: return "BooleanLiteral";
        case NodeKind::NullLiteral: return "NullLiteral";
        case NodeKind::RegExpLiteral: return "RegExpLiteral";
        case NodeKind::TemplateLiteral: return "TemplateLiteral";
        case NodeKind::TaggedTemplate: return "TaggedTemplate";
        case NodeKind::ArrayLiteral: return "ArrayLiteral";
        case NodeKind::ObjectLiteral: return "ObjectLiteral";
        case NodeKind::Property: return "Property";
        case NodeKind::FunctionExpr: return "FunctionExpr";
        case NodeKind::ArrowFunction: return "ArrowFunction";
        case NodeKind::ClassExpr: return "ClassExpr";
        case NodeKind::ClassMember: return "ClassMember";
        case NodeKind::ThisExpr: return "ThisExpr";
        case NodeKind::SuperExpr: return "SuperExpr";
        case NodeKind::Member: return "Member";
        case NodeKind::Call: return "Call";
        case NodeKind::NewExpr: return "NewExpr";
        case NodeKind::UnaryExpr: return "UnaryExpr";
        case NodeKind::UpdateExpr: return "UpdateExpr";
        case NodeKind::BinaryExpr: return "BinaryExpr";
        case NodeKind::AssignExpr: return "AssignExpr";
        case NodeKind::Conditional: return "Conditional";
        case NodeKind::Sequence: return "Sequence";
        case NodeKind::Spread: return "Spread";
        case NodeKind::YieldExpr: return "YieldExpr";
        case NodeKind::AwaitExpr: return "AwaitExpr";
        case NodeKind::ParenExpr: return "ParenExpr";
        case NodeKind::MetaProperty: return "MetaProperty";
        case NodeKind::ImportCall: return "ImportCall";
    }
    return "Unknown";
}

} // namespace puretop::ast
