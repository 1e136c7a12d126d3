#pragma once

#include <string>
#include "ast/NodeKind.h"

namespace puretop::ast {

// Forward declarations to break include cycles
template <typename T, NodeKind K> struct Literal;
struct Module;
struct VarDecl; struct FunctionDecl; struct ClassDecl; struct ExprStmt; struct BlockStmt; struct IfStmt;
struct ForStmt; struct ForInStmt; struct WhileStmt; struct DoWhileStmt; struct ReturnStmt; struct ThrowStmt;
struct TryStmt; struct SwitchStmt; struct BreakStmt; struct ContinueStmt; struct LabeledStmt; struct EmptyStmt;
struct DebuggerStmt; struct ImportDecl; struct ExportNamedDecl; struct ExportDefaultDecl; struct ExportAllDecl;
struct Name; struct PrivateName; struct NullLiteral; struct RegExpLiteral; struct TemplateLiteral; struct TaggedTemplate;
struct ArrayLiteral; struct ObjectLiteral; struct Property; struct FunctionExpr; struct ArrowFunction; struct ClassExpr;
struct ClassMember; struct ThisExpr; struct SuperExpr; struct Member; struct Call; struct NewExpr; struct Unary;
struct Update; struct Binary; struct Assign; struct Conditional; struct Sequence; struct Spread; struct YieldExpr;
struct AwaitExpr; struct ParenExpr; struct MetaProperty; struct ImportCall;

// Virtual visitor interface for AST traversal using polymorphism.
struct VisitorBase {
  virtual ~VisitorBase() = default;
  // One visit overload per concrete node type
  virtual void visit(const Module&) = 0;
  virtual void visit(const VarDecl&) {}
  virtual void visit(const FunctionDecl&) {}
  virtual void visit(const ClassDecl&) {}
  virtual void visit(const ExprStmt&) = 0;
  virtual void visit(const BlockStmt&) {}
  virtual void visit(const IfStmt&) {}
  virtual void visit(const ForStmt&) {}
  virtual void visit(const ForInStmt&) {}
  virtual void visit(const WhileStmt&) {}
  virtual void visit(const DoWhileStmt&) {}
  virtual void visit(const ReturnStmt&) {}
  virtual void visit(const ThrowStmt&) {}
  virtual void visit(const TryStmt&) {}
  virtual void visit(const SwitchStmt&) {}
  virtual void visit(const BreakStmt&) {}
  virtual void visit(const ContinueStmt&) {}
  virtual void visit(const LabeledStmt&) {}
  virtual void visit(const EmptyStmt&) {}
  virtual void visit(const DebuggerStmt&) {}
  virtual void visit(const ImportDecl&) {}
  virtual void visit(const ExportNamedDecl&) {}
  virtual void visit(const ExportDefaultDecl&) {}
  virtual void visit(const ExportAllDecl&) {}
  virtual void visit(const Name&) = 0;
  virtual void visit(const PrivateName&) {}
  virtual void visit(const Literal<std::string, NodeKind::NumberLiteral>&) {}
  virtual void visit(const Literal<std::string, NodeKind::BigIntLiteral>&) {}
  virtual void visit(const Literal<std::string, NodeKind::StringLiteral>&) {}
  virtual void visit(const Literal<bool, NodeKind::BooleanLiteral>&) {}
  virtual void visit(const NullLiteral&) {}
  virtual void visit(const RegExpLiteral&) {}
  virtual void visit(const TemplateLiteral&) {}
  virtual void visit(const TaggedTemplate&) {}
  virtual void visit(const ArrayLiteral&) {}
  virtual void visit(const ObjectLiteral&) {}
  virtual void visit(const Property&) {}
  virtual void visit(const FunctionExpr&) {}
  virtual void visit(const ArrowFunction&) {}
  virtual void visit(const ClassExpr&) {}
  virtual void visit(const ClassMember&) {}
  virtual void visit(const ThisExpr&) {}
  virtual void visit(const SuperExpr&) {}
  virtual void visit(const Member&) {}
  virtual void visit(const Call&) = 0;
  virtual void visit(const NewExpr&) = 0;
  virtual void visit(const Unary&) {}
  virtual void visit(const Update&) {}
  virtual void visit(const Binary&) {}
  virtual void visit(const Assign&) {}
  virtual void visit(const Conditional&) {}
  virtual void visit(const Sequence&) {}
  virtual void visit(const Spread&) {}
  virtual void visit(const YieldExpr&) {}
  virtual void visit(const AwaitExpr&) {}
  virtual void visit(const ParenExpr&) {}
  virtual void visit(const MetaProperty&) {}
  virtual void visit(const ImportCall&) {}
};

} // namespace puretop::ast
