#include "cli/ParseArgsInternals.h"
#include "puretop/exceptions/config_error.h"

#include <string>

namespace puretop::cli::detail {

/***
 * Name: puretop::cli::detail::parseColorValue
 * Purpose: Parse --color value into ColorMode.
 */
ColorMode parseColorValue(std::string_view value) {
    using enum puretop::cli::ColorMode;
    if (value == "always") { return Always; }
    if (value == "never") { return Never; }
    if (value == "auto") { return Auto; }
    throw exceptions::ConfigError("--color: expected always|never|auto, got '" + std::string(value) + "'");
}

} // namespace puretop::cli::detail
