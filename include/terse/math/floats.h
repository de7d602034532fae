/***
 * Name: terse::math (floats)
 * Purpose: Negated floating-point classification predicates and their aliases.
 * Inputs: Floating point value
 * Outputs: bool
 * Theory of Operation: Each predicate negates or renames a <cmath> classifier.
 */
#pragma once

#include <cmath>
#include <type_traits>

namespace terse {
namespace math {

template <typename T>
bool IsNotNaN(T value) {
  static_assert(std::is_floating_point_v<T>, "floating point type required");
  return !std::isnan(value);
}

template <typename T>
bool IsNotFinite(T value) { return !std::isfinite(value); }

template <typename T>
bool IsNotInfinite(T value) { return !std::isinf(value); }

template <typename T>
bool IsNotNormal(T value) { return !std::isnormal(value); }

template <typename T>
bool IsSubnormal(T value) {
  static_assert(std::is_floating_point_v<T>, "floating point type required");
  return std::fpclassify(value) == FP_SUBNORMAL;
}

template <typename T>
bool IsNotSubnormal(T value) { return !IsSubnormal(value); }

// Aliases
template <typename T>
bool IsDenormal(T value) { return IsSubnormal(value); }

template <typename T>
bool IsNotDenormal(T value) { return IsNotSubnormal(value); }

template <typename T>
bool IsNormalized(T value) { return std::isnormal(value); }

template <typename T>
bool IsNotNormalized(T value) { return IsNotNormal(value); }

}  // namespace math
}  // namespace terse
