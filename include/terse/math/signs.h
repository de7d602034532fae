/***
 * Name: terse::math (signs)
 * Purpose: Sign predicates and the sign function for arithmetic values.
 * Inputs: Arithmetic value by value
 * Outputs: bool predicates; Sign returns -1, 0 or +1 in the value's type
 * Theory of Operation: Comparisons against zero. NaN is neither negative nor
 *   positive, so the negated predicates are true for NaN and Sign(NaN) is NaN.
 */
#pragma once

#include <cmath>
#include <type_traits>

namespace terse {
namespace math {

template <typename T>
constexpr bool IsNegative(T value) {
  static_assert(std::is_arithmetic_v<T>, "IsNegative requires an arithmetic type");
  return value < T(0);
}

template <typename T>
constexpr bool IsPositive(T value) {
  static_assert(std::is_arithmetic_v<T>, "IsPositive requires an arithmetic type");
  return value > T(0);
}

template <typename T>
constexpr bool IsNotNegative(T value) { return !IsNegative(value); }

template <typename T>
constexpr bool IsNotPositive(T value) { return !IsPositive(value); }

template <typename T>
T Sign(T value) {
  static_assert(std::is_arithmetic_v<T>, "Sign requires an arithmetic type");
  if constexpr (std::is_floating_point_v<T>) {
    if (std::isnan(value)) return value;
  }
  if (IsNegative(value)) return T(-1);
  if (IsPositive(value)) return T(1);
  return T(0);
}

/*** IsZero / IsNotZero: equality with the additive identity (-0.0 counts as zero). */
template <typename T>
constexpr bool IsZero(T value) {
  static_assert(std::is_arithmetic_v<T>, "IsZero requires an arithmetic type");
  return value == T(0);
}

template <typename T>
constexpr bool IsNotZero(T value) { return !IsZero(value); }

/*** IsUnsigned: true for unsigned integral types. */
template <typename T>
constexpr bool IsUnsigned() {
  static_assert(std::is_integral_v<T>, "IsUnsigned requires an integral type");
  return std::is_unsigned_v<T>;
}

}  // namespace math
}  // namespace terse
