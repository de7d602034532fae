/***
 * Name: terse::exceptions::TerseException::TerseException
 * Purpose: Construct base exception with a message.
 * Inputs:
 *   - msg: human-readable error description
 * Outputs: Initialized exception object
 * Theory of Operation: Stores the message for later retrieval by what().
 */
#include "terse/exceptions/terse_exception.h"

#include <utility>

namespace terse {
namespace exceptions {

TerseException::TerseException(std::string msg) noexcept : message_(std::move(msg)) {}

}  // namespace exceptions
}  // namespace terse
