/***
 * Name: terse::math (roots)
 * Purpose: Real-valued n-th roots, generalizing sqrt/cbrt to any degree.
 * Inputs: Radicand and degree by value
 * Outputs: double results; NaN for numeric domain errors
 * Theory of Operation:
 *   Root(x, n) is pow(x, 1/n) except when the radicand is negative and the
 *   degree is an odd integer, where the real root -pow(-x, 1/n) is returned.
 *   Negative radicands with even or fractional degrees yield NaN, matching
 *   pow for a negative base and fractional exponent. A zero radicand yields
 *   0 for every nonzero degree; a zero degree yields NaN. Nothing throws.
 */
#pragma once

#include <cstdint>
#include <type_traits>

namespace terse {
namespace math {

/*** Root: principal n-th root of x. */
double Root(double x, double n);

namespace detail {
double RootOfSigned(std::int64_t x, double degree, bool odd_degree);
double RootOfUnsigned(std::uint64_t x, double degree);
}  // namespace detail

/***
 * Name: terse::math::Root (integer radicand)
 * Purpose: n-th root of an integral radicand with an integral degree.
 * Inputs: x (any integral type), degree (any integral type)
 * Outputs: double root
 * Theory of Operation: Signed radicands follow the odd-degree rule of
 *   Root(double, double); unsigned radicands are never negative and go
 *   straight to pow. Parity is taken from the integer degree itself, so
 *   degrees too wide for a double or for int64 keep their oddness.
 */
template <typename T, typename D,
          std::enable_if_t<std::is_integral_v<T> && std::is_integral_v<D>, int> = 0>
double Root(T x, D degree) {
  if constexpr (std::is_signed_v<T>) {
    return detail::RootOfSigned(static_cast<std::int64_t>(x), static_cast<double>(degree), degree % 2 != 0);
  } else {
    return detail::RootOfUnsigned(static_cast<std::uint64_t>(x), static_cast<double>(degree));
  }
}

/*** SquareRoot: Root(x, 2). */
double SquareRoot(double x);

/*** CubeRoot: Root(x, 3); real for negative radicands. */
double CubeRoot(double x);

/*** FourthRoot: Root(x, 4). */
double FourthRoot(double x);

}  // namespace math
}  // namespace terse
