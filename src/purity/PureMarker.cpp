/***
 * Name: puretop::purity::PureMarker (impl)
 */
#include "purity/PureMarker.h"
#include <cstddef>
#include <string_view>

namespace puretop::purity {

namespace {
std::string_view trim(std::string_view text) {
    constexpr std::string_view kSpace = " \t\r\n";
    const auto first = text.find_first_not_of(kSpace);
    if (first == std::string_view::npos) { return {}; }
    const auto last = text.find_last_not_of(kSpace);
    return text.substr(first, last - first + 1);
}
} // namespace

bool isPureMarker(const ast::Comment& comment) {
    if (comment.kind != ast::CommentKind::Block) { return false; }
    const auto body = trim(comment.text);
    return body == "#__PURE__" || body == "@__PURE__";
}

ast::Comment makePureMarker(std::size_t pos) {
    ast::Comment marker;
    marker.kind = ast::CommentKind::Block;
    marker.text = kPureMarkerText;
    marker.begin = pos;
    marker.end = pos;
    marker.synthesized = true;
    return marker;
}

} // namespace puretop::purity
