/***
 * Name: puretop::exceptions::ConfigError
 * Purpose: Exception for configuration and option errors.
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

class ConfigError : public PuretopException {
 public:
  explicit ConfigError(std::string msg) noexcept : PuretopException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace puretop
