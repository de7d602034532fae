/***
 * Name: terse::exceptions::TerseException
 * Purpose: Base class for all terse exceptions; do not throw built-in exceptions directly.
 * Inputs: Message string describing the error condition
 * Outputs: Exception object providing `what()` text
 * Theory of Operation: Derives from std::exception to interoperate with catch sites,
 *   but every throw in terse uses a custom type derived from this base.
 */
#pragma once

#include <exception>
#include <string>

namespace terse {
namespace exceptions {

class TerseException : public std::exception {
 public:
  virtual ~TerseException() noexcept = default;
  const char* what() const noexcept override;

 protected:
  explicit TerseException(std::string msg) noexcept;
  std::string message_;
};

}  // namespace exceptions
}  // namespace terse
