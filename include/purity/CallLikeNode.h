/***
 * Name: puretop::purity::CallLikeNode
 * Purpose: Transient view of one call or constructor-call expression.
 * Inputs:
 *   - ast::Call or ast::NewExpr
 * Outputs:
 *   - Node kind, statically resolved callee descriptor, argument count and
 *     source position.
 * Theory of Operation:
 *   The callee resolves to a name when it is an identifier or a non-computed
 *   member chain rooted at an identifier (`Object.create`), looking through
 *   parentheses. Any other callee shape is unresolved. Spread arguments count
 *   like any other argument; `new Foo` has zero arguments.
 */
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include "ast/Call.h"
#include "ast/Expr.h"
#include "ast/NewExpr.h"

namespace puretop::purity {

enum class CallKind { Call, Construct };

struct CallLikeNode {
    CallKind kind{CallKind::Call};
    std::optional<std::string> callee{}; // unset when not statically known
    std::size_t argCount{0};
    std::size_t begin{0}; // byte offset of the node's first character
    int line{0};
    int col{0};

    static CallLikeNode from(const ast::Call& call);
    static CallLikeNode from(const ast::NewExpr& expr);
};

// Dotted static name of a callee expression, if it has one
std::optional<std::string> resolveCallee(const ast::Expr& callee);

const char* to_string(CallKind kind);

} // namespace puretop::purity
