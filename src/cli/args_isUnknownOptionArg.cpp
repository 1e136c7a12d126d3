#include "cli/ParseArgsInternals.h"

namespace puretop::cli::detail {
    /***
     * Name: puretop::cli::detail::isUnknownOptionArg
     * Purpose: Detect unsupported option-like arguments that start with '-'.
     * A lone "-" is not an option.
     */
    bool isUnknownOptionArg(const std::string_view arg) {
        return arg.size() > 1 && arg[0] == '-';
    }
} // namespace puretop::cli::detail
