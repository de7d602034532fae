/***
 * Name: terse::exceptions::InvalidArgumentError
 * Purpose: Exception for arguments outside a helper's contract (e.g. negative repeat counts).
 * Inputs: Error message
 * Outputs: Exception object
 * Theory of Operation: Marker type deriving from TerseException.
 */
#pragma once

#include <string>
#include <utility>

#include "terse/exceptions/terse_exception.h"

namespace terse {
namespace exceptions {

class InvalidArgumentError : public TerseException {
 public:
  explicit InvalidArgumentError(std::string msg) noexcept : TerseException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace terse
