/***
 * Name: puretop::codegen::Emitter
 * Purpose: Regenerate module text with the comments passes attached.
 * Inputs:
 *   - The original source bytes the module was parsed from
 *   - The module's comment store
 * Outputs:
 *   - Source text with every synthesized comment rendered in front of the
 *     byte it leads (`#__PURE__` as a block comment directly before `foo()`).
 * Theory of Operation:
 *   Source comments are already part of the text, so only synthesized ones
 *   are spliced in, in ascending position order. No other byte changes, so
 *   formatting, source comments and line structure survive untouched.
 */
#pragma once

#include <string>
#include "ast/Comment.h"
#include "ast/SourceComments.h"

namespace puretop::codegen {

class Emitter {
 public:
  static std::string emit(const std::string& source, const ast::SourceComments& comments);

  // Block comments wrap `text` in comment delimiters; line comments get `//` and a newline
  static std::string render(const ast::Comment& comment);
};

} // namespace puretop::codegen
