/***
 * Name: puretop::config::DenylistLoader
 * Purpose: Build the effective denylist from command-line values and files.
 * Inputs:
 *   - DenylistSource: whether to start from the built-in helper names, names
 *     given with --deny, and paths given with --deny-file.
 * Outputs:
 *   - purity::Denylist
 * Theory of Operation:
 *   --deny values are comma separated. Denylist files hold one name per line;
 *   blank lines and `#` comments are ignored and surrounding whitespace is
 *   trimmed. Every entry must be an identifier or a dotted identifier chain.
 *   Invalid entries throw exceptions::ConfigError; unreadable files throw
 *   exceptions::FileReadError.
 */
#pragma once

#include <string>
#include <string_view>
#include <vector>
#include "purity/Denylist.h"

namespace puretop::config {

struct DenylistSource {
  bool useDefaults{true};
  std::vector<std::string> names{}; // raw --deny values, possibly comma separated
  std::vector<std::string> files{};
};

class DenylistLoader {
 public:
  static purity::Denylist load(const DenylistSource& source);

  // "a, b.c" -> {"a", "b.c"}; empty items are skipped
  static std::vector<std::string> splitNames(std::string_view csv);

  // Entries of a denylist file's text; `origin` prefixes error messages
  static std::vector<std::string> parseFile(std::string_view text, const std::string& origin);

  static bool isValidName(std::string_view name);
};

} // namespace puretop::config
