/***
 * Name: puretop::support::TrimSpaces
 * Purpose: Remove leading and trailing ASCII whitespace from a string_view.
 * Inputs: text
 * Outputs: view with the whitespace prefix and suffix removed
 */
#include "puretop/support/parse_util.h"

#include <cctype>
#include <cstddef>
#include <string_view>

namespace puretop {
namespace support {

std::string_view TrimSpaces(std::string_view text) {
  std::size_t index = 0;
  while (index < text.size() && std::isspace(static_cast<unsigned char>(text[index])) != 0) {
    ++index;
  }
  text.remove_prefix(index);
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())) != 0) {
    text.remove_suffix(1);
  }
  return text;
}

}  // namespace support
}  // namespace puretop
