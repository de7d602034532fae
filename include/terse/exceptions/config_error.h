/***
 * Name: terse::exceptions::ConfigError
 * Purpose: Exception for command-line and option errors in terse-calc.
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

class ConfigError : public TerseException {
 public:
  explicit ConfigError(std::string msg) noexcept : TerseException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace terse
