#include "cli/ParseArgsInternals.h"

namespace puretop::cli::detail {

/***
 * Name: puretop::cli::detail::collectRemainingAsInputs
 * Purpose: Gather argv entries after `--` as input paths, even when they start with '-'.
 */
void collectRemainingAsInputs(std::size_t startIndex, int argc, char** argv, Options& out) {
    for (int j = static_cast<int>(startIndex); j < argc; ++j) {
        // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        out.inputs.emplace_back(argv[j]);
    }
}

} // namespace puretop::cli::detail
