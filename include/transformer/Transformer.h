/***
 * Name: puretop::Transformer
 * Purpose: Source-to-source entry point: annotate pure top-level calls.
 * Inputs:
 *   - Module source text (UTF-8), a display name for diagnostics
 *   - Denylist of helper callees (defaults to the built-in helper names)
 * Outputs:
 *   - TransformResult: output text, pass statistics and per-call decisions.
 * Theory of Operation:
 *   Lex, parse, run opt::PureToplevel, splice the markers back into the
 *   original text with codegen::Emitter. Syntax errors propagate as
 *   exceptions::ParseError.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>
#include "optimizer/PureToplevel.h"
#include "purity/Denylist.h"

namespace puretop {

struct TransformResult {
  std::string code;
  std::size_t annotated{0};
  std::unordered_map<std::string, uint64_t> stats{};
  std::vector<opt::PureDecision> decisions{};
};

class Transformer {
 public:
  static TransformResult transform(const std::string& source, const std::string& name,
                                   const purity::Denylist& denylist);

  // Default denylist, output text only
  static std::string transform(const std::string& source);
};

} // namespace puretop
