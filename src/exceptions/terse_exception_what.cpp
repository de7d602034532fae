/***
 * Name: terse::exceptions::TerseException::what
 * Purpose: Return the stored error message.
 * Inputs: none
 * Outputs: C-string pointer valid for the lifetime of the exception
 * Theory of Operation: Returns message_.c_str(); noexcept.
 */
#include "terse/exceptions/terse_exception.h"

namespace terse::exceptions {

const char* TerseException::what() const noexcept { return message_.c_str(); }

}  // namespace terse::exceptions
