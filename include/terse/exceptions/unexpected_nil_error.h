/***
 * Name: terse::exceptions::UnexpectedNilError
 * Purpose: Exception for unwrapping an optional that holds no value.
 * Inputs: Error message
 * Outputs: Exception object
 * Theory of Operation: Marker type deriving from TerseException. Raised by
 *   optional::Unwrap so that a missing value fails loudly instead of being
 *   replaced by a default.
 */
#pragma once

#include <string>
#include <utility>

#include "terse/exceptions/terse_exception.h"

namespace terse {
namespace exceptions {

class UnexpectedNilError : public TerseException {
 public:
  explicit UnexpectedNilError(std::string msg) noexcept : TerseException(std::move(msg)) {}
  UnexpectedNilError() : TerseException("unexpectedly found nil while unwrapping an optional value") {}
};

}  // namespace exceptions
}  // namespace terse
