/***
 * Name: puretop::obs::AstPrinter (impl)
 */
#include "observability/AstPrinter.h"
#include "ast/Nodes.h"
#include <string>

namespace puretop::obs {

using ast::NodeKind;

namespace {

std::string renderComment(const ast::Comment& c) {
  if (c.kind == ast::CommentKind::Line) { return "//" + c.text; }
  return "/*" + c.text + "*/";
}

template <typename T>
const T& as(const ast::Node& n) { return static_cast<const T&>(n); }

std::string named(const char* label, const std::string& name) {
  return name.empty() ? std::string(label) : std::string(label) + " name=" + name;
}

} // namespace

std::string AstPrinter::print(const ast::Module& m) {
  ss_.str(""); ss_.clear(); depth_ = 0;
  comments_ = &m.comments;
  printedComments_.clear();
  walk(&m);
  comments_ = nullptr;
  return ss_.str();
}

void AstPrinter::enter(const ast::Node& n) {
  line(describe(n) + " @" + std::to_string(n.line) + ":" + std::to_string(n.col));
  depth_++;
  if (comments_ == nullptr || n.kind == NodeKind::Module) { return; }
  if (!comments_->hasLeading(n.begin) || !printedComments_.insert(n.begin).second) { return; }
  for (const auto& c : comments_->leading(n.begin)) {
    line(std::string(c.synthesized ? "Comment+ " : "Comment ") + renderComment(c));
  }
}

void AstPrinter::leave(const ast::Node& n) {
  (void)n;
  depth_--;
}

std::string AstPrinter::describe(const ast::Node& n) { // NOLINT(readability-function-size)
  const std::string kind = ast::to_string(n.kind);
  switch (n.kind) {
    case NodeKind::VarDecl: return kind + " " + as<ast::VarDecl>(n).declKind;
    case NodeKind::FunctionDecl: {
      const auto& f = as<ast::FunctionDecl>(n);
      return named("FunctionDecl", f.name) + (f.isAsync ? " async" : "") + (f.isGenerator ? " generator" : "");
    }
    case NodeKind::FunctionExpr: {
      const auto& f = as<ast::FunctionExpr>(n);
      return named("FunctionExpr", f.name) + (f.isAsync ? " async" : "") + (f.isGenerator ? " generator" : "");
    }
    case NodeKind::ArrowFunction: return as<ast::ArrowFunction>(n).isAsync ? kind + " async" : kind;
    case NodeKind::ClassDecl: return named("ClassDecl", as<ast::ClassDecl>(n).name);
    case NodeKind::ClassExpr: return named("ClassExpr", as<ast::ClassExpr>(n).name);
    case NodeKind::ClassMember: {
      const auto& m = as<ast::ClassMember>(n);
      static const char* const kKinds[] = {"constructor", "method", "getter", "setter", "field", "static-block"};
      return kind + " " + kKinds[static_cast<int>(m.memberKind)] + (m.isStatic ? " static" : "") + (m.computed ? " computed" : "");
    }
    case NodeKind::Property: {
      const auto& p = as<ast::Property>(n);
      static const char* const kKinds[] = {"init", "shorthand", "method", "getter", "setter", "spread"};
      return kind + " " + kKinds[static_cast<int>(p.propKind)] + (p.computed ? " computed" : "");
    }
    case NodeKind::Name: return kind + " " + as<ast::Name>(n).id;
    case NodeKind::PrivateName: return kind + " #" + as<ast::PrivateName>(n).id;
    case NodeKind::NumberLiteral: return kind + " " + as<ast::NumberLiteral>(n).value;
    case NodeKind::BigIntLiteral: return kind + " " + as<ast::BigIntLiteral>(n).value;
    case NodeKind::StringLiteral: return kind + " " + as<ast::StringLiteral>(n).value;
    case NodeKind::BooleanLiteral: return kind + (as<ast::BooleanLiteral>(n).value ? " true" : " false");
    case NodeKind::RegExpLiteral: {
      const auto& r = as<ast::RegExpLiteral>(n);
      return kind + " /" + r.pattern + "/" + r.flags;
    }
    case NodeKind::Member: {
      const auto& m = as<ast::Member>(n);
      return kind + (m.computed ? " computed" : "") + (m.optional ? " optional" : "");
    }
    case NodeKind::Call: {
      const auto& c = as<ast::Call>(n);
      return kind + " args=" + std::to_string(c.args.size()) + (c.optional ? " optional" : "");
    }
    case NodeKind::NewExpr: {
      const auto& e = as<ast::NewExpr>(n);
      return kind + " args=" + std::to_string(e.args.size()) + (e.hasArgList ? "" : " no-parens");
    }
    case NodeKind::UnaryExpr: return kind + " " + ast::to_string(as<ast::Unary>(n).op);
    case NodeKind::UpdateExpr: {
      const auto& u = as<ast::Update>(n);
      return kind + " " + u.op + (u.prefix ? " prefix" : " postfix");
    }
    case NodeKind::BinaryExpr: return kind + " " + ast::to_string(as<ast::Binary>(n).op);
    case NodeKind::AssignExpr: return kind + " " + as<ast::Assign>(n).op;
    case NodeKind::ForInStmt: {
      const auto& f = as<ast::ForInStmt>(n);
      return kind + (f.loopKind == ast::ForInKind::In ? " in" : " of") + (f.isAwait ? " await" : "");
    }
    case NodeKind::ImportDecl: return kind + " from=" + as<ast::ImportDecl>(n).source;
    default: return kind;
  }
}

} // namespace puretop::obs
