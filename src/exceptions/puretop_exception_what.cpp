/***
 * Name: puretop::exceptions::PuretopException::what
 * Purpose: Return the stored error message.
 * Inputs: none
 * Outputs: C-string pointer valid for the lifetime of the exception
 * Theory of Operation: Returns message_.c_str(); noexcept.
 */
#include "puretop/exceptions/puretop_exception.h"

namespace puretop::exceptions {

const char* PuretopException::what() const noexcept { return message_.c_str(); }

}  // namespace puretop::exceptions
