/***
 * Name: puretop::purity::classify (impl)
 */
#include "purity/Classifier.h"

namespace puretop::purity {

Verdict classify(const CallLikeNode& node, const LexicalContext& context, const Denylist& denylist) {
    if (!context.isTopLevel()) { return Verdict::NotTopLevel; }
    if (node.argCount > 0) { return Verdict::HasArguments; }
    if (node.callee && denylist.contains(*node.callee)) { return Verdict::DenylistedCallee; }
    return Verdict::Eligible;
}

} // namespace puretop::purity
