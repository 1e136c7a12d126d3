/***
 * Name: puretop::exceptions::PuretopException
 * Purpose: Base class for all puretop exceptions; do not use built-in exceptions directly.
 * Inputs: Message string describing the error condition
 * Outputs: Exception object providing `what()` text
 * Theory of Operation: Derives from std::exception to interoperate with catch sites,
 *   but all throws in puretop must use a custom type derived from this base.
 */
#pragma once

#include <exception>
#include <string>

namespace puretop {
namespace exceptions {

class PuretopException : public std::exception {
 public:
  virtual ~PuretopException() noexcept = default;
  const char* what() const noexcept override;

 protected:
  explicit PuretopException(std::string msg) noexcept;
  std::string message_;
};

}  // namespace exceptions
}  // namespace puretop
