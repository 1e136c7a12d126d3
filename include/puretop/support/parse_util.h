/***
 * Name: puretop::support (parse_util)
 * Purpose: Small text helpers shared by option and config parsing.
 */
#pragma once

#include <string>
#include <string_view>

namespace puretop {
namespace support {

/*** TrimSpaces: Remove leading and trailing ASCII whitespace from view. */
std::string_view TrimSpaces(std::string_view text);

/*** ParseDigitsStrict: Parse a non-empty run of base-10 digits filling the view; set err on failure. */
bool ParseDigitsStrict(std::string_view text, long long& value, std::string* err);

}  // namespace support
}  // namespace puretop
