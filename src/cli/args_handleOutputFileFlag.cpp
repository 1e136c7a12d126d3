#include "cli/ParseArgsInternals.h"
#include "puretop/exceptions/config_error.h"

namespace puretop::cli::detail {
    /***
     * Name: puretop::cli::detail::handleOutputFileFlag
     * Purpose: Handle `-o <file>` output flag by consuming the next argument.
     */
    bool handleOutputFileFlag(int &idx, int argc, char **argv, Options &out) {
        // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        if (const std::string_view arg{argv[idx]}; !isFlag(arg, "-o")) { return false; }
        if (idx + 1 >= argc) { throw exceptions::ConfigError("-o requires a file name"); }
        // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        out.outputFile = argv[++idx];
        return true;
    }
} // namespace puretop::cli::detail
