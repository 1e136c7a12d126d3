/***
 * Name: puretop::purity::to_string (Verdict, MutationOutcome)
 */
#include "purity/Verdict.h"

namespace puretop::purity {

const char* to_string(Verdict verdict) {
    switch (verdict) {
        case Verdict::Eligible: return "Eligible";
        case Verdict::NotTopLevel: return "NotTopLevel";
        case Verdict::HasArguments: return "HasArguments";
        case Verdict::DenylistedCallee: return "DenylistedCallee";
    }
    return "Unknown";
}

const char* to_string(MutationOutcome outcome) {
    switch (outcome) {
        case MutationOutcome::Applied: return "Applied";
        case MutationOutcome::Skipped: return "Skipped";
        case MutationOutcome::AlreadyMarked: return "AlreadyMarked";
    }
    return "Unknown";
}

} // namespace puretop::purity
