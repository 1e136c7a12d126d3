/***
 * Name: puretop::support::ReadFile
 * Purpose: Read the full contents of a text file into a string.
 * Inputs:
 *   - path: filesystem path to read
 * Outputs:
 *   - out: populated with file contents on success
 *   - err: error message on failure
 * Theory of Operation: Uses std::ifstream in binary mode with exceptions disabled;
 *   checks .good() so CRLF sources keep their exact bytes.
 */
// NOLINTNEXTLINE(misc-include-cleaner) - include interface to ensure signature stays in sync
#include "puretop/support/fs.h"

#include <fstream>
#include <ios>
#include <sstream>
#include <string>

namespace puretop {
namespace support {

bool ReadFile(const std::string& path, std::string& out, std::string& err) {
  const std::ifstream file_stream(path, std::ios::binary);
  if (!file_stream.good()) {
    err = "failed to open file: " + path;
    return false;
  }
  std::ostringstream stream;
  stream << file_stream.rdbuf();
  out = stream.str();
  return true;
}

}  // namespace support
}  // namespace puretop
