/***
 * Name: terse::math (powers)
 * Purpose: Exponentiation, squaring and cubing helpers, absolute value, truncating remainder.
 * Inputs: Arithmetic values by value (in/out reference for the Form* variants)
 * Outputs: Values of the same type, or double for Power
 * Theory of Operation: Thin wrappers over built-in arithmetic and <cmath>.
 *   Power follows pow semantics, including NaN for a negative base with a
 *   non-integer exponent.
 */
#pragma once

#include <cmath>
#include <type_traits>

namespace terse {
namespace math {

/*** Power: base raised to an arbitrary real exponent. */
double Power(double base, double exponent);

template <typename T>
constexpr T Squared(T value) {
  static_assert(std::is_arithmetic_v<T>, "Squared requires an arithmetic type");
  return value * value;
}

template <typename T>
constexpr T Cubed(T value) {
  static_assert(std::is_arithmetic_v<T>, "Cubed requires an arithmetic type");
  return value * value * value;
}

template <typename T>
constexpr void FormSquare(T& value) {
  value = Squared(value);
}

template <typename T>
constexpr void FormCube(T& value) {
  value = Cubed(value);
}

// Abs: magnitude of a signed value. The most negative integer has no
// representable magnitude; callers own that overflow as with std::abs.
template <typename T>
constexpr T Abs(T value) {
  static_assert(std::is_arithmetic_v<T> && std::is_signed_v<T>, "Abs requires a signed arithmetic type");
  return value < T(0) ? -value : value;
}

/*** TruncatingRemainder: remainder of x / y rounded toward zero (fmod). */
template <typename T>
T TruncatingRemainder(T x, T y) {
  static_assert(std::is_floating_point_v<T>, "TruncatingRemainder requires a floating point type");
  return std::fmod(x, y);
}

}  // namespace math
}  // namespace terse
