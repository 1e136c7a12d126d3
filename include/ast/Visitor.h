#pragma once

#include "ast/Nodes.h"
#include "ast/VisitorBase.h"

namespace puretop::ast {

template <typename V>
void dispatch(Node& n, V& v) {
    switch (n.kind) {
        case NodeKind::Module: v.visit(static_cast<Module&>(n)); break;
        case NodeKind::VarDecl: v.visit(static_cast<VarDecl&>(n)); break;
        case NodeKind::FunctionDecl: v.visit(static_cast<FunctionDecl&>(n)); break;
        case NodeKind::ClassDecl: v.visit(static_cast<ClassDecl&>(n)); break;
        case NodeKind::ExprStmt: v.visit(static_cast<ExprStmt&>(n)); break;
        case NodeKind::BlockStmt: v.visit(static_cast<BlockStmt&>(n)); break;
        case NodeKind::IfStmt: v.visit(static_cast<IfStmt&>(n)); break;
        case NodeKind::ForStmt: v.visit(static_cast<ForStmt&>(n)); break;
        case NodeKind::ForInStmt: v.visit(static_cast<ForInStmt&>(n)); break;
        case NodeKind::WhileStmt: v.visit(static_cast<WhileStmt&>(n)); break;
        case NodeKind::DoWhileStmt: v.visit(static_cast<DoWhileStmt&>(n)); break;
        case NodeKind::ReturnStmt: v.visit(static_cast<ReturnStmt&>(n)); break;
        case NodeKind::ThrowStmt: v.visit(static_cast<ThrowStmt&>(n)); break;
        case NodeKind::TryStmt: v.visit(static_cast<TryStmt&>(n)); break;
        case NodeKind::SwitchStmt: v.visit(static_cast<SwitchStmt&>(n)); break;
        case NodeKind::BreakStmt: v.visit(static_cast<BreakStmt&>(n)); break;
        case NodeKind::ContinueStmt: v.visit(static_cast<ContinueStmt&>(n)); break;
        case NodeKind::LabeledStmt: v.visit(static_cast<LabeledStmt&>(n)); break;
        case NodeKind::EmptyStmt: v.visit(static_cast<EmptyStmt&>(n)); break;
        case NodeKind::DebuggerStmt: v.visit(static_cast<DebuggerStmt&>(n)); break;
        case NodeKind::ImportDecl: v.visit(static_cast<ImportDecl&>(n)); break;
        case NodeKind::ExportNamedDecl: v.visit(static_cast<ExportNamedDecl&>(n)); break;
        case NodeKind::ExportDefaultDecl: v.visit(static_cast<ExportDefaultDecl&>(n)); break;
        case NodeKind::ExportAllDecl: v.visit(static_cast<ExportAllDecl&>(n)); break;
        case NodeKind::Name: v.visit(static_cast<Name&>(n)); break;
        case NodeKind::PrivateName: v.visit(static_cast<PrivateName&>(n)); break;
        case NodeKind::NumberLiteral: v.visit(static_cast<NumberLiteral&>(n)); break;
        case NodeKind::BigIntLiteral: v.visit(static_cast<BigIntLiteral&>(n)); break;
        case NodeKind::StringLiteral: v.visit(static_cast<StringLiteral&>(n)); break;
        case NodeKind::BooleanLiteral: v.visit(static_cast<BooleanLiteral&>(n)); break;
        case NodeKind::NullLiteral: v.visit(static_cast<NullLiteral&>(n)); break;
        case NodeKind::RegExpLiteral: v.visit(static_cast<RegExpLiteral&>(n)); break;
        case NodeKind::TemplateLiteral: v.visit(static_cast<TemplateLiteral&>(n)); break;
        case NodeKind::TaggedTemplate: v.visit(static_cast<TaggedTemplate&>(n)); break;
        case NodeKind::ArrayLiteral: v.visit(static_cast<ArrayLiteral&>(n)); break;
        case NodeKind::ObjectLiteral: v.visit(static_cast<ObjectLiteral&>(n)); break;
        case NodeKind::Property: v.visit(static_cast<Property&>(n)); break;
        case NodeKind::FunctionExpr: v.visit(static_cast<FunctionExpr&>(n)); break;
        case NodeKind::ArrowFunction: v.visit(static_cast<ArrowFunction&>(n)); break;
        case NodeKind::ClassExpr: v.visit(static_cast<ClassExpr&>(n)); break;
        case NodeKind::ClassMember: v.visit(static_cast<ClassMember&>(n)); break;
        case NodeKind::ThisExpr: v.visit(static_cast<ThisExpr&>(n)); break;
        case NodeKind::SuperExpr: v.visit(static_cast<SuperExpr&>(n)); break;
        case NodeKind::Member: v.visit(static_cast<Member&>(n)); break;
        case NodeKind::Call: v.visit(static_cast<Call&>(n)); break;
        case NodeKind::NewExpr: v.visit(static_cast<NewExpr&>(n)); break;
        case NodeKind::UnaryExpr: v.visit(static_cast<Unary&>(n)); break;
        case NodeKind::UpdateExpr: v.visit(static_cast<Update&>(n)); break;
        case NodeKind::BinaryExpr: v.visit(static_cast<Binary&>(n)); break;
        case NodeKind::AssignExpr: v.visit(static_cast<Assign&>(n)); break;
        case NodeKind::Conditional: v.visit(static_cast<Conditional&>(n)); break;
        case NodeKind::Sequence: v.visit(static_cast<Sequence&>(n)); break;
        case NodeKind::Spread: v.visit(static_cast<Spread&>(n)); break;
        case NodeKind::YieldExpr: v.visit(static_cast<YieldExpr&>(n)); break;
        case NodeKind::AwaitExpr: v.visit(static_cast<AwaitExpr&>(n)); break;
        case NodeKind::ParenExpr: v.visit(static_cast<ParenExpr&>(n)); break;
        case NodeKind::MetaProperty: v.visit(static_cast<MetaProperty&>(n)); break;
        case NodeKind::ImportCall: v.visit(static_cast<ImportCall&>(n)); break;
        default: break;
    }
}

template <typename V>
void dispatch(const Node& n, V& v) {
    dispatch(const_cast<Node&>(n), v);
}

} // namespace puretop::ast
