/***
 * Name: puretop::support::WriteFile
 * Purpose: Replace a file's contents with a string.
 * Inputs:
 *   - path: filesystem path to write
 *   - data: content to write
 * Outputs:
 *   - err: error message on failure
 * Theory of Operation: A symlink is followed to the file it names. The data
 *   goes to `<target>.puretop.tmp` in binary mode, the existing target's
 *   permission bits are copied onto it, and it is renamed over the target,
 *   so a failed --in-place write leaves the input untouched.
 */
// NOLINTNEXTLINE(misc-include-cleaner) - include interface to ensure signature stays in sync
#include "puretop/support/fs.h"

#include <filesystem>
#include <fstream>
#include <ios>
#include <string>
#include <system_error>

namespace puretop {
namespace support {

namespace fs = std::filesystem;

static bool resolveTarget(const std::string& path, fs::path& target, std::string& err) {
  std::error_code ec;
  target = fs::path(path);
  if (!fs::is_symlink(fs::symlink_status(target, ec))) { return true; }
  target = fs::canonical(target, ec);
  if (ec) {
    err = "failed to resolve link: " + path + ": " + ec.message();
    return false;
  }
  return true;
}

bool WriteFile(const std::string& path, const std::string& data, std::string& err) {
  fs::path target;
  if (!resolveTarget(path, target, err)) { return false; }
  const fs::path tmpPath = fs::path(target.string() + ".puretop.tmp");
  {
    std::ofstream file_stream(tmpPath, std::ios::binary | std::ios::trunc);
    if (!file_stream.good()) {
      err = "failed to open file for write: " + path;
      return false;
    }
    file_stream << data;
    file_stream.flush();
    if (!file_stream.good()) {
      err = "failed to write file: " + path;
      std::error_code cleanup;
      fs::remove(tmpPath, cleanup);
      return false;
    }
  }
  std::error_code ec;
  const auto existing = fs::status(target, ec);
  if (!ec && fs::exists(existing)) {
    fs::permissions(tmpPath, existing.permissions(), fs::perm_options::replace, ec);
    if (ec) {
      err = "failed to copy permissions to " + path + ": " + ec.message();
      std::error_code cleanup;
      fs::remove(tmpPath, cleanup);
      return false;
    }
  }
  fs::rename(tmpPath, target, ec);
  if (ec) {
    err = "failed to replace file: " + path + ": " + ec.message();
    std::error_code cleanup;
    fs::remove(tmpPath, cleanup);
    return false;
  }
  return true;
}

}  // namespace support
}  // namespace puretop
