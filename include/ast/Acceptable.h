/**
 * @file
 * @brief CRTP kind tag for concrete nodes and the checked downcast built on it.
 */
#pragma once

#include "ast/Node.h"
#include "ast/NodeKind.h"

namespace puretop::ast {

// Concrete nodes record their NodeKind statically so node_cast<T> can test it.
// Polymorphic accept(VisitorBase&) is provided by Node.
template <typename Derived, NodeKind K>
struct Acceptable {
    static constexpr NodeKind kKind = K;
};

// nullptr unless `n` is a T
template <typename T>
const T* node_cast(const Node* n) {
    return (n != nullptr && n->kind == T::kKind) ? static_cast<const T*>(n) : nullptr;
}

} // namespace puretop::ast
