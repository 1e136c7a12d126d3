/***
 * Name: puretop::opt::PureToplevel (impl)
 * Purpose: Classify and annotate every call-like node of a module.
 */
#include "optimizer/PureToplevel.h"
#include "ast/Acceptable.h"
#include "ast/ArrowFunction.h"
#include "ast/AstWalker.h"
#include "ast/Call.h"
#include "ast/ClassMember.h"
#include "ast/FunctionDecl.h"
#include "ast/FunctionExpr.h"
#include "ast/Module.h"
#include "ast/Name.h"
#include "ast/NewExpr.h"
#include "ast/Property.h"
#include "ast/SourceComments.h"
#include "purity/Annotator.h"
#include "purity/Classifier.h"
#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace puretop::opt {

using purity::CallLikeNode;
using purity::LexicalContext;
using purity::MutationOutcome;
using purity::UnitKind;
using purity::Verdict;

namespace {

std::string staticKeyName(const ast::Expr* key, bool computed) {
  const auto* name = ast::node_cast<ast::Name>(key);
  if (name == nullptr || computed) { return {}; }
  return name->id;
}

struct PureWalker : public ast::AstWalker {
  const purity::Denylist& denylist;
  ast::SourceComments& comments;
  std::unordered_map<std::string, uint64_t>& stats;
  std::vector<PureDecision>& decisions;
  LexicalContext context{LexicalContext::topLevel()};
  // Set while walking a method's FunctionExpr so it opens a Method unit
  bool methodPending{false};
  std::string methodName{};
  // Start offsets owned by an enclosing call-like node that must not carry a marker
  std::unordered_set<std::size_t> withheldStarts{};
  size_t applied{0};

  PureWalker(const purity::Denylist& d, ast::SourceComments& c,
             std::unordered_map<std::string, uint64_t>& s, std::vector<PureDecision>& out)
      : denylist(d), comments(c), stats(s), decisions(out) {}

  // Restores the enclosing context on scope exit
  struct ContextScope {
    PureWalker& walker;
    LexicalContext saved;
    ContextScope(PureWalker& w, UnitKind kind, std::string name)
        : walker(w), saved(w.context) { walker.context = saved.enter(kind, std::move(name)); }
    ~ContextScope() { walker.context = saved; }
    ContextScope(const ContextScope&) = delete;
    ContextScope& operator=(const ContextScope&) = delete;
  };

  void record(const CallLikeNode& node) {
    const Verdict verdict = purity::classify(node, context, denylist);
    // A marker here would lead the enclosing call, which is not eligible
    const bool withheld = withheldStarts.count(node.begin) != 0;
    if (!withheld && verdict != Verdict::Eligible) { withheldStarts.insert(node.begin); }
    const MutationOutcome outcome =
        withheld ? MutationOutcome::Skipped : purity::annotate(node, verdict, comments);
    ++stats["visited"];
    ++stats[node.kind == purity::CallKind::Call ? "calls" : "constructs"];
    switch (verdict) {
      case Verdict::Eligible: ++stats["eligible"]; break;
      case Verdict::NotTopLevel: ++stats["not_top_level"]; break;
      case Verdict::HasArguments: ++stats["has_arguments"]; break;
      case Verdict::DenylistedCallee: ++stats["denylisted"]; break;
    }
    if (outcome == MutationOutcome::Applied) { ++stats["annotated"]; ++applied; }
    if (outcome == MutationOutcome::AlreadyMarked) { ++stats["already_marked"]; }
    if (withheld && verdict == Verdict::Eligible) { ++stats["withheld"]; }
    decisions.push_back(PureDecision{node, verdict, outcome, context.unit(), context.enclosingName()});
  }

  void visit(const ast::Call& call) override {
    record(CallLikeNode::from(call));
    AstWalker::visit(call);
  }

  void visit(const ast::NewExpr& expr) override {
    record(CallLikeNode::from(expr));
    AstWalker::visit(expr);
  }

  void visit(const ast::FunctionDecl& fn) override {
    ContextScope scope(*this, UnitKind::Function, fn.name);
    AstWalker::visit(fn);
  }

  void visit(const ast::FunctionExpr& fn) override {
    const UnitKind kind = methodPending ? UnitKind::Method : UnitKind::Function;
    std::string name = methodPending ? methodName : fn.name;
    methodPending = false;
    methodName.clear();
    ContextScope scope(*this, kind, std::move(name));
    AstWalker::visit(fn);
  }

  void visit(const ast::ArrowFunction& arrow) override {
    ContextScope scope(*this, UnitKind::Arrow, {});
    AstWalker::visit(arrow);
  }

  void visit(const ast::Property& prop) override {
    switch (prop.propKind) {
      case ast::PropertyKind::Method:
      case ast::PropertyKind::Getter:
      case ast::PropertyKind::Setter:
        walk(prop.key.get());
        walkMethod(prop.value.get(), staticKeyName(prop.key.get(), prop.computed));
        break;
      default:
        AstWalker::visit(prop);
        break;
    }
  }

  void visit(const ast::ClassMember& member) override {
    // Computed keys evaluate once, at class definition time
    walk(member.key.get());
    switch (member.memberKind) {
      case ast::ClassMemberKind::Constructor:
        walkMethod(member.value.get(), "constructor");
        break;
      case ast::ClassMemberKind::Method:
      case ast::ClassMemberKind::Getter:
      case ast::ClassMemberKind::Setter:
        walkMethod(member.value.get(), staticKeyName(member.key.get(), member.computed));
        break;
      case ast::ClassMemberKind::Field:
        if (member.isStatic) {
          walk(member.value.get());
        } else {
          // Instance initializers run once per construction
          ContextScope scope(*this, UnitKind::ClassField, staticKeyName(member.key.get(), member.computed));
          walk(member.value.get());
        }
        break;
      case ast::ClassMemberKind::StaticBlock:
        for (const auto& stmt : member.body) { walk(stmt.get()); }
        break;
    }
  }

  void walkMethod(const ast::Expr* value, std::string name) {
    methodPending = true;
    methodName = std::move(name);
    walk(value);
    methodPending = false;
    methodName.clear();
  }
};

} // namespace

size_t PureToplevel::run(ast::Module& m) {
  stats_.clear();
  decisions_.clear();
  for (const char* key : {"visited", "calls", "constructs", "eligible", "annotated", "already_marked",
                          "not_top_level", "has_arguments", "denylisted", "withheld"}) {
    stats_[key] = 0;
  }
  PureWalker walker(denylist_, m.comments, stats_, decisions_);
  walker.walk(&m);
  return walker.applied;
}

} // namespace puretop::opt
