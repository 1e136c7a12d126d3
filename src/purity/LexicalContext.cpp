/***
 * Name: puretop::purity::to_string (UnitKind)
 */
#include "purity/LexicalContext.h"

namespace puretop::purity {

const char* to_string(UnitKind kind) {
    switch (kind) {
        case UnitKind::Program: return "Program";
        case UnitKind::Function: return "Function";
        case UnitKind::Arrow: return "Arrow";
        case UnitKind::Method: return "Method";
        case UnitKind::ClassField: return "ClassField";
    }
    return "Unknown";
}

} // namespace puretop::purity
