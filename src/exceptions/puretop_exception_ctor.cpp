/***
 * Name: puretop::exceptions::PuretopException::PuretopException
 * Purpose: Construct base exception with a message.
 * Inputs:
 *   - msg: human-readable error description
 * Outputs: Initialized exception object
 * Theory of Operation: Stores the message for later retrieval by what().
 */
#include "puretop/exceptions/puretop_exception.h"

#include <utility>

namespace puretop {
namespace exceptions {

PuretopException::PuretopException(std::string msg) noexcept : message_(std::move(msg)) {}

}  // namespace exceptions
}  // namespace puretop
