/***
 * Name: puretop::opt::PureToplevel
 * Purpose: Mark zero-argument top-level calls and constructor calls pure.
 * Inputs:
 *   - ast::Module (its comment store is mutated)
 *   - Denylist of helper callees that must stay unmarked
 * Outputs:
 *   - Number of `#__PURE__` markers added.
 *   - stats(): visited, calls, constructs, eligible, annotated, already_marked,
 *     not_top_level, has_arguments, denylisted, withheld.
 *   - decisions(): one record per call-like node, in document order.
 * Theory of Operation:
 *   Walks the module once in document order, keeping a stack of lexical
 *   contexts: function declarations and expressions, arrows, methods and
 *   instance field initializers push a nested context; static fields, static
 *   blocks and computed keys stay in the surrounding one. Each Call and
 *   NewExpr is classified, handed to the annotator, then descended into so
 *   calls in callees and arguments are visited too. An eligible node that
 *   starts where an enclosing ineligible call-like node starts (`a().b(x)`)
 *   is withheld, since its marker would lead the enclosing call. Running the pass again
 *   over its own output adds nothing.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include "ast/Nodes.h"
#include "optimizer/Pass.h"
#include "purity/CallLikeNode.h"
#include "purity/Denylist.h"
#include "purity/LexicalContext.h"
#include "purity/Verdict.h"

namespace puretop::opt {

struct PureDecision {
  purity::CallLikeNode node;
  purity::Verdict verdict{purity::Verdict::Eligible};
  purity::MutationOutcome outcome{purity::MutationOutcome::Skipped};
  purity::UnitKind unit{purity::UnitKind::Program};
  std::string enclosing; // innermost named unit, empty at top level
};

class PureToplevel : public Pass {
 public:
  PureToplevel() : denylist_(purity::Denylist::defaults()) {}
  explicit PureToplevel(purity::Denylist denylist) : denylist_(std::move(denylist)) {}

  const char* name() const override { return "pure_toplevel"; }
  size_t run(ast::Module& m) override;

  const std::unordered_map<std::string, uint64_t>& stats() const { return stats_; }
  const std::vector<PureDecision>& decisions() const { return decisions_; }
  const purity::Denylist& denylist() const { return denylist_; }

 private:
  purity::Denylist denylist_;
  std::unordered_map<std::string, uint64_t> stats_{};
  std::vector<PureDecision> decisions_{};
};

} // namespace puretop::opt
