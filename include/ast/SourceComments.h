/***
 * Name: puretop::ast::SourceComments
 * Purpose: Position-keyed store of leading comments for one module.
 * Inputs:
 *   - Comments collected by the lexer, keyed by the offset of the token that
 *     follows them.
 *   - Comments synthesized by passes, keyed by the start offset of the node
 *     they lead.
 * Outputs:
 *   - Lookups by position and the synthesized comments in document order.
 * Theory of Operation:
 *   Nodes that start at the same offset (a call and its callee, an expression
 *   statement and its expression) share one slot, so a comment leads all of
 *   them and is emitted once.
 */
#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <utility>
#include <vector>
#include "ast/Comment.h"

namespace puretop::ast {

class SourceComments {
 public:
    void addLeading(std::size_t pos, Comment comment);

    const std::vector<Comment>& leading(std::size_t pos) const;
    bool hasLeading(std::size_t pos) const;
    bool anyLeading(std::size_t pos, const std::function<bool(const Comment&)>& pred) const;

    // Synthesized comments in ascending position order (insertion order within a slot)
    std::vector<std::pair<std::size_t, const Comment*>> synthesized() const;

    std::size_t size() const;
    std::size_t synthesizedCount() const;
    const std::map<std::size_t, std::vector<Comment>>& all() const { return leading_; }

 private:
    std::map<std::size_t, std::vector<Comment>> leading_{};
};

} // namespace puretop::ast
