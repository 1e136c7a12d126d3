/***
 * Name: puretop::ast::AstWalker (impl)
 * Purpose: Document-order child traversal for every node kind.
 */
#include "ast/AstWalker.h"
#include "ast/Nodes.h"

namespace puretop::ast {

namespace {
template <typename T>
void walkAll(AstWalker& w, const std::vector<std::unique_ptr<T>>& items) {
  for (const auto& item : items) { w.walk(item.get()); }
}
} // namespace

void AstWalker::walk(const Node* n) {
  if (n == nullptr) { return; }
  enter(*n);
  n->accept(*this);
  leave(*n);
}

void AstWalker::visit(const Module& m) { walkAll(*this, m.body); }

void AstWalker::visit(const VarDecl& d) {
  for (const auto& decl : d.declarations) {
    walk(decl.target.get());
    walk(decl.init.get());
  }
}

void AstWalker::visit(const FunctionDecl& f) {
  walkAll(*this, f.params);
  walkAll(*this, f.body);
}

void AstWalker::visit(const ClassDecl& c) {
  walk(c.superClass.get());
  walkAll(*this, c.members);
}

void AstWalker::visit(const ExprStmt& s) { walk(s.value.get()); }

void AstWalker::visit(const BlockStmt& b) { walkAll(*this, b.body); }

void AstWalker::visit(const IfStmt& s) {
  walk(s.cond.get());
  walk(s.consequent.get());
  walk(s.alternate.get());
}

void AstWalker::visit(const ForStmt& s) {
  walk(s.init.get());
  walk(s.test.get());
  walk(s.update.get());
  walk(s.body.get());
}

void AstWalker::visit(const ForInStmt& s) {
  walk(s.left.get());
  walk(s.right.get());
  walk(s.body.get());
}

void AstWalker::visit(const WhileStmt& s) {
  walk(s.cond.get());
  walk(s.body.get());
}

void AstWalker::visit(const DoWhileStmt& s) {
  walk(s.body.get());
  walk(s.cond.get());
}

void AstWalker::visit(const ReturnStmt& s) { walk(s.value.get()); }
void AstWalker::visit(const ThrowStmt& s) { walk(s.value.get()); }

void AstWalker::visit(const TryStmt& s) {
  walk(s.block.get());
  walk(s.param.get());
  walk(s.handler.get());
  walk(s.finalizer.get());
}

void AstWalker::visit(const SwitchStmt& s) {
  walk(s.discriminant.get());
  for (const auto& c : s.cases) {
    walk(c.test.get());
    walkAll(*this, c.body);
  }
}

void AstWalker::visit(const LabeledStmt& s) { walk(s.body.get()); }

void AstWalker::visit(const ExportNamedDecl& e) { walk(e.declaration.get()); }
void AstWalker::visit(const ExportDefaultDecl& e) { walk(e.declaration.get()); }

void AstWalker::visit(const TemplateLiteral& t) { walkAll(*this, t.exprs); }

void AstWalker::visit(const TaggedTemplate& t) {
  walk(t.tag.get());
  walk(t.quasi.get());
}

void AstWalker::visit(const ArrayLiteral& a) { walkAll(*this, a.elements); }
void AstWalker::visit(const ObjectLiteral& o) { walkAll(*this, o.properties); }

void AstWalker::visit(const Property& p) {
  // Shorthand keys are the same identifier as the value
  if (p.propKind != PropertyKind::Shorthand) { walk(p.key.get()); }
  walk(p.value.get());
}

void AstWalker::visit(const FunctionExpr& f) {
  walkAll(*this, f.params);
  walkAll(*this, f.body);
}

void AstWalker::visit(const ArrowFunction& a) {
  walkAll(*this, a.params);
  walk(a.exprBody.get());
  walkAll(*this, a.body);
}

void AstWalker::visit(const ClassExpr& c) {
  walk(c.superClass.get());
  walkAll(*this, c.members);
}

void AstWalker::visit(const ClassMember& m) {
  walk(m.key.get());
  walk(m.value.get());
  walkAll(*this, m.body);
}

void AstWalker::visit(const Member& m) {
  walk(m.object.get());
  walk(m.property.get());
}

void AstWalker::visit(const Call& c) {
  walk(c.callee.get());
  walkAll(*this, c.args);
}

void AstWalker::visit(const NewExpr& n) {
  walk(n.callee.get());
  walkAll(*this, n.args);
}

void AstWalker::visit(const Unary& u) { walk(u.operand.get()); }
void AstWalker::visit(const Update& u) { walk(u.operand.get()); }

void AstWalker::visit(const Binary& b) {
  walk(b.lhs.get());
  walk(b.rhs.get());
}

void AstWalker::visit(const Assign& a) {
  walk(a.target.get());
  walk(a.value.get());
}

void AstWalker::visit(const Conditional& c) {
  walk(c.test.get());
  walk(c.consequent.get());
  walk(c.alternate.get());
}

void AstWalker::visit(const Sequence& s) { walkAll(*this, s.exprs); }
void AstWalker::visit(const Spread& s) { walk(s.argument.get()); }
void AstWalker::visit(const YieldExpr& y) { walk(y.argument.get()); }
void AstWalker::visit(const AwaitExpr& a) { walk(a.argument.get()); }
void AstWalker::visit(const ParenExpr& p) { walk(p.expr.get()); }
void AstWalker::visit(const ImportCall& i) { walkAll(*this, i.args); }

} // namespace puretop::ast
