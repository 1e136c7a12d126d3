#include "cli/ParseArgsInternals.h"
#include "puretop/exceptions/config_error.h"
#include "puretop/support/parse_util.h"

#include <string>

namespace puretop::cli::detail {
    /***
     * Name: puretop::cli::detail::applyPrefixedOptions
     * Purpose: Parse and apply --key=value options like deny/ast-log/color/diag-context.
     */
    bool applyPrefixedOptions(std::string_view arg, Options &out) {
        if (constexpr std::string_view denyPrefix{"--deny="}; arg.rfind(denyPrefix, 0) == 0) {
            out.denyNames.emplace_back(arg.substr(denyPrefix.size()));
            return true;
        }

        if (constexpr std::string_view denyFilePrefix{"--deny-file="}; arg.rfind(denyFilePrefix, 0) == 0) {
            const auto path = arg.substr(denyFilePrefix.size());
            if (path.empty()) { throw exceptions::ConfigError("--deny-file requires a path"); }
            out.denyFiles.emplace_back(path);
            return true;
        }

        if (constexpr std::string_view astLogPrefix{"--ast-log="}; arg.rfind(astLogPrefix, 0) == 0) {
            out.astLog = parseAstLogValue(arg.substr(astLogPrefix.size()));
            return true;
        }

        if (constexpr std::string_view logPathPrefix{"--log-path="}; arg.rfind(logPathPrefix, 0) == 0) {
            out.logPath = std::string(arg.substr(logPathPrefix.size()));
            return true;
        }

        if (constexpr std::string_view colorPrefix{"--color="}; arg.rfind(colorPrefix, 0) == 0) {
            out.color = parseColorValue(arg.substr(colorPrefix.size()));
            return true;
        }

        if (constexpr std::string_view diagPrefix{"--diag-context="}; arg.rfind(diagPrefix, 0) == 0) {
            long long numLines = 0;
            std::string err;
            if (!support::ParseDigitsStrict(arg.substr(diagPrefix.size()), numLines, &err)) {
                throw exceptions::ConfigError("--diag-context: " + err);
            }
            out.diagContext = static_cast<int>(numLines);
            return true;
        }
        return false;
    }
} // namespace puretop::cli::detail
