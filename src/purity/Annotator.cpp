/***
 * Name: puretop::purity::annotate (impl)
 */
#include "purity/Annotator.h"
#include "purity/PureMarker.h"
#include <utility>

namespace puretop::purity {

MutationOutcome annotate(const CallLikeNode& node, Verdict verdict, ast::SourceComments& comments) {
    if (verdict != Verdict::Eligible) { return MutationOutcome::Skipped; }
    if (comments.anyLeading(node.begin, isPureMarker)) { return MutationOutcome::AlreadyMarked; }
    auto marker = makePureMarker(node.begin);
    marker.line = node.line;
    marker.col = node.col;
    comments.addLeading(node.begin, std::move(marker));
    return MutationOutcome::Applied;
}

} // namespace puretop::purity
