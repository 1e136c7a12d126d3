/***
 * Name: puretop::ast::AstWalker
 * Purpose: Visitor that descends into every child in document order.
 * Inputs:
 *   - Any node (usually a Module).
 * Outputs:
 *   - Calls enter()/leave() around every visited node.
 * Theory of Operation:
 *   Each visit overload walks the node's children in the order they appear in
 *   the source. Subclasses override a visit overload to observe a node kind and
 *   call AstWalker::visit to keep descending, or override enter()/leave() to
 *   observe every node.
 */
#pragma once

#include "ast/VisitorBase.h"

namespace puretop::ast {

struct Node;

class AstWalker : public VisitorBase {
 public:
  // Visits `n` (no-op on null) bracketed by enter()/leave()
  void walk(const Node* n);

  void visit(const Module& m) override;
  void visit(const VarDecl& d) override;
  void visit(const FunctionDecl& f) override;
  void visit(const ClassDecl& c) override;
  void visit(const ExprStmt& s) override;
  void visit(const BlockStmt& b) override;
  void visit(const IfStmt& s) override;
  void visit(const ForStmt& s) override;
  void visit(const ForInStmt& s) override;
  void visit(const WhileStmt& s) override;
  void visit(const DoWhileStmt& s) override;
  void visit(const ReturnStmt& s) override;
  void visit(const ThrowStmt& s) override;
  void visit(const TryStmt& s) override;
  void visit(const SwitchStmt& s) override;
  void visit(const LabeledStmt& s) override;
  void visit(const ExportNamedDecl& e) override;
  void visit(const ExportDefaultDecl& e) override;
  void visit(const Name&) override {}
  void visit(const TemplateLiteral& t) override;
  void visit(const TaggedTemplate& t) override;
  void visit(const ArrayLiteral& a) override;
  void visit(const ObjectLiteral& o) override;
  void visit(const Property& p) override;
  void visit(const FunctionExpr& f) override;
  void visit(const ArrowFunction& a) override;
  void visit(const ClassExpr& c) override;
  void visit(const ClassMember& m) override;
  void visit(const Member& m) override;
  void visit(const Call& c) override;
  void visit(const NewExpr& n) override;
  void visit(const Unary& u) override;
  void visit(const Update& u) override;
  void visit(const Binary& b) override;
  void visit(const Assign& a) override;
  void visit(const Conditional& c) override;
  void visit(const Sequence& s) override;
  void visit(const Spread& s) override;
  void visit(const YieldExpr& y) override;
  void visit(const AwaitExpr& a) override;
  void visit(const ParenExpr& p) override;
  void visit(const ImportCall& i) override;

 protected:
  virtual void enter(const Node&) {}
  virtual void leave(const Node&) {}
};

} // namespace puretop::ast
