/***
 * Name: puretop::purity::LexicalContext
 * Purpose: Where a call-like node sits relative to executable units.
 * Inputs:
 *   - Built by the host traversal as it enters functions, arrows, methods and
 *     instance field initializers.
 * Outputs:
 *   - isTopLevel(): no enclosing function or method body.
 * Theory of Operation:
 *   Immutable value; enter() returns the nested context, so the host restores
 *   the outer one by keeping its own copy.
 */
#pragma once

#include <string>
#include <utility>

namespace puretop::purity {

enum class UnitKind { Program, Function, Arrow, Method, ClassField };

const char* to_string(UnitKind kind);

class LexicalContext {
 public:
    LexicalContext() = default;

    static LexicalContext topLevel() { return LexicalContext{}; }

    LexicalContext enter(UnitKind kind, std::string name = {}) const {
        LexicalContext nested;
        nested.unit_ = kind;
        nested.depth_ = depth_ + 1;
        nested.name_ = std::move(name);
        return nested;
    }

    bool isTopLevel() const { return depth_ == 0; }
    UnitKind unit() const { return unit_; }
    int functionDepth() const { return depth_; }
    // Name of the innermost unit; empty for anonymous units and the program
    const std::string& enclosingName() const { return name_; }

 private:
    UnitKind unit_{UnitKind::Program};
    int depth_{0};
    std::string name_{};
};

} // namespace puretop::purity
