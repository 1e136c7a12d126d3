/***
 * Name: puretop::config::DenylistLoader (impl)
 */
#include "config/DenylistLoader.h"
#include "puretop/exceptions/config_error.h"
#include "puretop/exceptions/file_read_error.h"
#include "puretop/support/fs.h"
#include "puretop/support/parse_util.h"
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace puretop::config {

namespace {

bool isNameStart(unsigned char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_' || c == '$' || c >= 0x80;
}

bool isNamePart(unsigned char c) { return isNameStart(c) || (c >= '0' && c <= '9'); }

void requireValid(std::string_view name, const std::string& origin) {
  if (DenylistLoader::isValidName(name)) { return; }
  throw exceptions::ConfigError(origin + ": invalid denylist entry '" + std::string(name) + "'");
}

} // namespace

bool DenylistLoader::isValidName(std::string_view name) {
  if (name.empty()) { return false; }
  bool segmentStart = true;
  for (const char ch : name) {
    const auto c = static_cast<unsigned char>(ch);
    if (c == '.') {
      if (segmentStart) { return false; }
      segmentStart = true;
      continue;
    }
    if (segmentStart ? !isNameStart(c) : !isNamePart(c)) { return false; }
    segmentStart = false;
  }
  return !segmentStart;
}

std::vector<std::string> DenylistLoader::splitNames(std::string_view csv) {
  std::vector<std::string> out;
  std::size_t start = 0;
  while (start <= csv.size()) {
    auto comma = csv.find(',', start);
    if (comma == std::string_view::npos) { comma = csv.size(); }
    const auto item = support::TrimSpaces(csv.substr(start, comma - start));
    if (!item.empty()) { out.emplace_back(item); }
    start = comma + 1;
  }
  return out;
}

std::vector<std::string> DenylistLoader::parseFile(std::string_view text, const std::string& origin) {
  std::vector<std::string> out;
  std::size_t start = 0;
  int lineNo = 0;
  while (start < text.size()) {
    auto eol = text.find('\n', start);
    if (eol == std::string_view::npos) { eol = text.size(); }
    ++lineNo;
    auto entry = text.substr(start, eol - start);
    if (const auto hash = entry.find('#'); hash != std::string_view::npos) { entry = entry.substr(0, hash); }
    entry = support::TrimSpaces(entry);
    if (!entry.empty()) {
      requireValid(entry, origin + ":" + std::to_string(lineNo));
      out.emplace_back(entry);
    }
    start = eol + 1;
  }
  return out;
}

purity::Denylist DenylistLoader::load(const DenylistSource& source) {
  std::vector<std::string> extra;
  for (const auto& value : source.names) {
    const auto names = splitNames(value);
    if (names.empty()) { throw exceptions::ConfigError("--deny: expected at least one name"); }
    for (const auto& name : names) {
      requireValid(name, "--deny");
      extra.push_back(name);
    }
  }
  for (const auto& path : source.files) {
    std::string text;
    std::string err;
    if (!support::ReadFile(path, text, err)) { throw exceptions::FileReadError(err); }
    const auto names = parseFile(text, path);
    extra.insert(extra.end(), names.begin(), names.end());
  }
  const purity::Denylist base = source.useDefaults ? purity::Denylist::defaults() : purity::Denylist{};
  return base.with(extra);
}

} // namespace puretop::config
