/***
 * Name: terse::strings::DescribeFloatingPoint
 * Purpose: Display string for float and double values.
 * Inputs: value
 * Outputs: Shortest round-trip text; "nan", "inf", "-inf" for non-finite values
 * Theory of Operation: std::to_chars without a precision emits the shortest
 *   representation that parses back to the same value. Integral results gain a
 *   ".0" suffix so they still read as floating point ("27.0", "-0.0").
 */
#include "terse/strings/describe.h"

#include <array>
#include <charconv>
#include <cmath>
#include <string>
#include <system_error>

namespace terse::strings {

namespace {

template <typename T>
std::string DescribeImpl(T value) {
  if (std::isnan(value)) {
    return "nan";
  }
  if (std::isinf(value)) {
    return value < 0 ? "-inf" : "inf";
  }
  std::array<char, 64> buffer{};
  const auto result = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value);
  if (result.ec != std::errc{}) {
    return std::to_string(value);
  }
  std::string text(buffer.data(), result.ptr);
  if (text.find_first_of(".e") == std::string::npos) {
    text += ".0";
  }
  return text;
}

}  // namespace

std::string DescribeFloatingPoint(double value) { return DescribeImpl(value); }

std::string DescribeFloatingPoint(float value) { return DescribeImpl(value); }

}  // namespace terse::strings
