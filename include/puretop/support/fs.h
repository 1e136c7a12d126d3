/***
 * Name: puretop::support (fs)
 * Purpose: Minimal file IO helpers for reading and writing text files.
 * Inputs: Paths and string buffers
 * Outputs: File contents to/from disk
 * Theory of Operation: Thin wrappers over fstream to centralize error handling.
 *   Files are read and written in binary mode so byte offsets recorded by the
 *   lexer line up with the text written back out.
 */
#pragma once

#include <string>

namespace puretop {
namespace support {

/*** ReadFile: Read entire file into out. Return true on success. */
bool ReadFile(const std::string& path, std::string& out, std::string& err);

/*** WriteFile: Write entire string to path. Return true on success. */
bool WriteFile(const std::string& path, const std::string& data, std::string& err);

}  // namespace support
}  // namespace puretop
