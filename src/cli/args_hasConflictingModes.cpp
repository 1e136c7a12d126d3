#include "cli/ParseArgsInternals.h"

namespace puretop::cli::detail {
    /***
     * Name: puretop::cli::detail::hasConflictingModes
     * Purpose: Validate mutually exclusive output modes.
     */
    bool hasConflictingModes(const Options &opts) {
        return opts.inPlace && !opts.outputFile.empty();
    }
} // namespace puretop::cli::detail
