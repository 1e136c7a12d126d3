/***
 * Name: puretop::purity::CallLikeNode (impl)
 */
#include "purity/CallLikeNode.h"
#include "ast/Member.h"
#include "ast/Name.h"
#include "ast/Acceptable.h"
#include "ast/ParenExpr.h"
#include <optional>
#include <string>

namespace puretop::purity {

std::optional<std::string> resolveCallee(const ast::Expr& callee) {
    if (const auto* name = ast::node_cast<ast::Name>(&callee)) { return name->id; }
    if (const auto* paren = ast::node_cast<ast::ParenExpr>(&callee)) {
        if (!paren->expr) { return std::nullopt; }
        return resolveCallee(*paren->expr);
    }
    const auto* member = ast::node_cast<ast::Member>(&callee);
    // `a[b]`, `a.#b` and optional links have no static dotted name
    if (member == nullptr || member->computed || member->optional || !member->object) { return std::nullopt; }
    const auto* property = ast::node_cast<ast::Name>(member->property.get());
    if (property == nullptr) { return std::nullopt; }
    auto base = resolveCallee(*member->object);
    if (!base) { return std::nullopt; }
    return *base + "." + property->id;
}

CallLikeNode CallLikeNode::from(const ast::Call& call) {
    CallLikeNode node;
    node.kind = CallKind::Call;
    if (call.callee) { node.callee = resolveCallee(*call.callee); }
    node.argCount = call.args.size();
    node.begin = call.begin;
    node.line = call.line;
    node.col = call.col;
    return node;
}

CallLikeNode CallLikeNode::from(const ast::NewExpr& expr) {
    CallLikeNode node;
    node.kind = CallKind::Construct;
    if (expr.callee) { node.callee = resolveCallee(*expr.callee); }
    node.argCount = expr.args.size();
    node.begin = expr.begin;
    node.line = expr.line;
    node.col = expr.col;
    return node;
}

const char* to_string(CallKind kind) {
    return kind == CallKind::Call ? "Call" : "Construct";
}

} // namespace puretop::purity
