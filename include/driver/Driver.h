#ifndef PURETOP_DRIVER_DRIVER_H
#define PURETOP_DRIVER_DRIVER_H

/***
 * Name: puretop::Driver
 * Purpose: Orchestrate the end-to-end pipeline for the puretop tool.
 * Inputs:
 *   - CLI options
 * Outputs:
 *   - Annotated sources on stdout, in `-o <file>` or rewritten in place;
 *     diagnostics, reports and metrics on stderr; optional log files.
 *   - Exit code: 0 success, 1 parse or I/O failure, 2 configuration error.
 * Theory of Operation:
 *   Loads the denylist, then for each input reads, lexes, parses, runs the
 *   PureToplevel pass and emits the annotated text, timing every stage in
 *   obs::Metrics. Inputs are processed one after another; a failing input is
 *   reported and the remaining inputs are still processed.
 */

#include <string>

// Forward declarations to reduce header coupling
namespace puretop { namespace cli { struct Options; } }

namespace puretop {
    struct Diagnostic {
        std::string message;
        std::string file;
        int line{0};
        int col{0};
    };

    class Driver {
    public:
        static int run(const cli::Options &opts);

        // PURETOP_COLOR set to 1/true/yes
        static bool use_env_color();

        static void print_error(const Diagnostic &diag, bool color, int context);
    };
} // namespace puretop

#endif // PURETOP_DRIVER_DRIVER_H
