/***
 * Name: puretop::support::ParseDigitsStrict
 * Purpose: Parse a base-10 option value such as `--diag-context=3`; report errors.
 * Inputs: text view, out value, optional error string pointer
 * Outputs: value and status; err set on failure
 */
#include "puretop/support/parse_util.h"

#include <cctype>
#include <limits>
#include <string>
#include <string_view>

namespace puretop {
namespace support {

auto ParseDigitsStrict(std::string_view text, long long& value, std::string* err) -> bool {
  value = 0;
  constexpr int kBase10 = 10;
  constexpr char kZeroChar = '0';
  std::string local_err;
  if (text.empty()) {
    local_err = "expected a number";
  }
  for (const char digit_char : text) {
    if (std::isdigit(static_cast<unsigned char>(digit_char)) == 0) {
      local_err = "invalid character in number";
      break;
    }
    value = (value * kBase10) + (digit_char - kZeroChar);
    if (value > std::numeric_limits<int>::max()) {
      local_err = "number out of range";
      break;
    }
  }
  if (!local_err.empty()) {
    if (err != nullptr) {
      *err = local_err;
    }
    return false;
  }
  return true;
}

}  // namespace support
}  // namespace puretop
