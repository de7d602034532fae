/***
 * Name: terse::math (parity)
 * Purpose: Even/odd classification of signed integers.
 * Inputs: Signed integral value
 * Outputs: Parity enum or bool predicates
 * Theory of Operation: Zero is even; the remainder is taken by magnitude so
 *   negative odd values classify as odd.
 */
#pragma once

#include <type_traits>

namespace terse {
namespace math {

enum class Parity { Even, Odd };

template <typename T>
constexpr Parity ParityOf(T value) {
  static_assert(std::is_integral_v<T> && std::is_signed_v<T>, "ParityOf requires a signed integral type");
  return (value % 2 == 0) ? Parity::Even : Parity::Odd;
}

template <typename T>
constexpr bool IsEven(T value) { return ParityOf(value) == Parity::Even; }

template <typename T>
constexpr bool IsOdd(T value) { return ParityOf(value) == Parity::Odd; }

template <typename T>
constexpr bool IsNotEven(T value) { return !IsEven(value); }

template <typename T>
constexpr bool IsNotOdd(T value) { return !IsOdd(value); }

}  // namespace math
}  // namespace terse
