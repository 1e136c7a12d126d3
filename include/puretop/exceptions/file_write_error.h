/***
 * Name: puretop::exceptions::FileWriteError
 * Purpose: Exception for failures writing transformed output.
 * Inputs: Error message
 * Outputs: Exception object
 * Theory of Operation: Marker type deriving from PuretopException.
 */
#pragma once

#include <string>
#include <utility>
#include "puretop/exceptions/puretop_exception.h"

namespace puretop {
namespace exceptions {

class FileWriteError : public PuretopException {
 public:
  explicit FileWriteError(std::string msg) noexcept : PuretopException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace puretop
