/***
 * Name: puretop::exceptions::ParseError
 * Purpose: Exception for lexing and parsing failures.
 * Inputs: Error message and 1-based source location
 * Outputs: Exception object
 * Theory of Operation: Carries the location so the driver can print a caret
 *   under the offending column.
 */
#pragma once

#include <string>
#include <utility>
#include "puretop/exceptions/puretop_exception.h"

namespace puretop {
namespace exceptions {

class ParseError : public PuretopException {
 public:
  ParseError(std::string msg, int line, int col) noexcept
      : PuretopException(std::move(msg)), line_(line), col_(col) {}

  int line() const noexcept { return line_; }
  int col() const noexcept { return col_; }

 private:
  int line_{0};
  int col_{0};
};

}  // namespace exceptions
}  // namespace puretop
