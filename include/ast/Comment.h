/***
 * Name: puretop::ast::Comment
 * Purpose: One source or synthesized comment.
 * Theory of Operation:
 *   `text` holds the body without delimiters (`#__PURE__` for the pure marker).
 *   Comments read from the source keep their byte range; synthesized ones are
 *   inserted by passes and carry an empty range at the position they lead.
 */
#pragma once

#include <cstddef>
#include <string>

namespace puretop::ast {

enum class CommentKind {
    Line,  // `// ...` (also a leading hashbang)
    Block  // `/* ... */`
};

struct Comment {
    CommentKind kind{CommentKind::Block};
    std::string text{};
    std::size_t begin{0};
    std::size_t end{0};
    int line{0};
    int col{0};
    bool synthesized{false};
};

} // namespace puretop::ast
