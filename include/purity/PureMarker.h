/**
 * @file
 * @brief The `#__PURE__` leading comment understood by bundlers and minifiers.
 */
#pragma once

#include <cstddef>
#include "ast/Comment.h"

namespace puretop::purity {

inline constexpr const char* kPureMarkerText = "#__PURE__";

// Block comment whose trimmed body is `#__PURE__` or `@__PURE__`
bool isPureMarker(const ast::Comment& comment);

// Synthesized marker leading the node that starts at `pos`
ast::Comment makePureMarker(std::size_t pos);

} // namespace puretop::purity
