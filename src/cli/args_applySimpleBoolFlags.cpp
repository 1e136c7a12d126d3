#include "cli/ParseArgsInternals.h"

namespace puretop::cli::detail {
    /***
     * Name: puretop::cli::detail::applySimpleBoolFlags
     * Purpose: Handle flag-only boolean options and set outputs.
     */
    bool applySimpleBoolFlags(std::string_view arg, Options &out) {
        if (isFlag(arg, "-h") || isFlag(arg, "--help")) {
            out.showHelp = true;
            return true;
        }
        if (isFlag(arg, "--in-place")) {
            out.inPlace = true;
            return true;
        }
        if (isFlag(arg, "--no-default-deny")) {
            out.noDefaultDeny = true;
            return true;
        }
        if (isFlag(arg, "--report")) {
            out.report = true;
            return true;
        }
        if (isFlag(arg, "--metrics")) {
            out.metrics = true;
            return true;
        }
        if (isFlag(arg, "--metrics-json")) {
            out.metricsJson = true;
            return true;
        }
        if (isFlag(arg, "--log-lexer")) {
            out.logLexer = true;
            return true;
        }
        if (isFlag(arg, "--log-ast")) {
            out.logAst = true;
            return true;
        }
        if (isFlag(arg, "--ast-log")) {
            out.astLog = AstLogMode::Before;
            return true;
        }
        return false;
    }
} // namespace puretop::cli::detail
