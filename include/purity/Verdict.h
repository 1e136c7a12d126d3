/***
 * Name: puretop::purity::Verdict
 * Purpose: Classification result for one call-like node.
 * Theory of Operation:
 *   Exactly one reason is reported; the classifier checks nesting, then
 *   argument count, then the denylist.
 */
#pragma once

namespace puretop::purity {

enum class Verdict {
    Eligible,
    NotTopLevel,
    HasArguments,
    DenylistedCallee
};

// Result of asking the annotator to act on a verdict
enum class MutationOutcome {
    Applied,       // a pure marker was attached
    Skipped,       // verdict was not Eligible
    AlreadyMarked  // Eligible, but the node's position already carries a marker
};

const char* to_string(Verdict verdict);
const char* to_string(MutationOutcome outcome);

} // namespace puretop::purity
