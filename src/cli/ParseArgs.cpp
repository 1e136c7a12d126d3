#include "cli/ParseArgs.h"
#include "cli/ColorMode.h"
#include "cli/Options.h"
#include "cli/ParseArgsInternals.h"
#include "puretop/exceptions/config_error.h"
#include <iostream>
#include <string>
#include <string_view>

namespace puretop::cli {
    /***
     * Name: puretop::cli::ParseArgs
     * Purpose: GCC-like CLI argument parser for puretop.
     * Theory of Operation:
     *   Option helpers report bad values by throwing exceptions::ConfigError;
     *   every failure is printed here and turned into a false return.
     */
    bool ParseArgs(const int argc, char **argv, Options &out) {
        try {
            for (int i = 1; i < argc; ++i) {
                // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
                const std::string_view arg{argv[i]};
                if (detail::isFlag(arg, "--")) {
                    detail::collectRemainingAsInputs(i + 1, argc, argv, out);
                    break;
                }
                if (detail::handleOutputFileFlag(i, argc, argv, out)) { continue; }
                if (detail::applySimpleBoolFlags(arg, out)) { continue; }
                if (detail::applyPrefixedOptions(arg, out)) { continue; }

                // Positional
                if (detail::isUnknownOptionArg(arg)) {
                    std::cerr << "puretop: unknown option '" << arg << "'\n";
                    return false;
                }
                out.inputs.emplace_back(std::string(arg));
            }
        } catch (const exceptions::ConfigError& ex) {
            std::cerr << "puretop: " << ex.what() << "\n";
            return false;
        }

        if (out.showHelp) { return true; }

        if (detail::hasConflictingModes(out)) {
            std::cerr << "puretop: cannot use -o and --in-place together\n";
            return false;
        }
        if (out.inputs.empty()) {
            std::cerr << "puretop: no input files provided\n";
            return false;
        }
        if (out.inputs.size() > 1 && !out.inPlace) {
            std::cerr << "puretop: multiple input files require --in-place\n";
            return false;
        }

        return true;
    }
} // namespace puretop::cli
