#include "cli/ParseArgsInternals.h"
#include "puretop/exceptions/config_error.h"

#include <string>

namespace puretop::cli::detail {

/***
 * Name: puretop::cli::detail::parseAstLogValue
 * Purpose: Parse --ast-log value into AstLogMode.
 */
AstLogMode parseAstLogValue(std::string_view value) {
    using enum puretop::cli::AstLogMode;
    if (value == "before") { return Before; }
    if (value == "after") { return After; }
    if (value == "both") { return Both; }
    throw exceptions::ConfigError("--ast-log: expected before|after|both, got '" + std::string(value) + "'");
}

} // namespace puretop::cli::detail
