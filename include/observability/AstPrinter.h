/***
 * Name: puretop::obs::AstPrinter
 * Purpose: AST pretty-printer for diagnostics/logging.
 * Inputs:
 *   - ast::Module (and its comment store)
 * Outputs:
 *   - Formatted string with node kinds, salient fields and positions, one
 *     node per line; leading comments are listed under the outermost node
 *     starting at their position.
 * Theory of Operation:
 *   Extends ast::AstWalker; enter() writes the node line with indentation
 *   reflecting tree depth, leave() unindents.
 */
#pragma once

#include <cstddef>
#include <set>
#include <sstream>
#include <string>
#include "ast/AstWalker.h"
#include "ast/Nodes.h"

namespace puretop::obs {

class AstPrinter : public ast::AstWalker {
 public:
  std::string print(const ast::Module& m);

  // One-line description of a node without its children
  static std::string describe(const ast::Node& n);

 protected:
  void enter(const ast::Node& n) override;
  void leave(const ast::Node& n) override;

 private:
  void indent() { for (int i = 0; i < depth_; ++i) ss_ << "  "; }
  void line(const std::string& s) { indent(); ss_ << s << "\n"; }
  std::ostringstream ss_{};
  int depth_{0};
  const ast::SourceComments* comments_{nullptr};
  std::set<std::size_t> printedComments_{};
};

} // namespace puretop::obs
