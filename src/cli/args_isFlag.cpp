#include "cli/ParseArgsInternals.h"

namespace puretop::cli::detail {
    /***
     * Name: puretop::cli::detail::isFlag
     * Purpose: Check if an argument exactly matches a flag.
     */
    bool isFlag(const std::string_view arg, const std::string_view flag) {
        return arg == flag;
    }
} // namespace puretop::cli::detail
