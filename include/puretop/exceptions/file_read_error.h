/***
 * Name: puretop::exceptions::FileReadError
 * Purpose: Exception for filesystem read failures.
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

class FileReadError : public PuretopException {
 public:
  explicit FileReadError(std::string msg) noexcept : PuretopException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace puretop
