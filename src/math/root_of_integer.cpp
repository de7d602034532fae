/***
 * Name: terse::math::detail::RootOfSigned / RootOfUnsigned
 * Purpose: Integer radicand roots backing the Root template.
 * Inputs: radicand widened to 64 bits, degree as double, parity of the integral degree
 * Outputs: double root, NaN for a zero degree or an even root of a negative radicand
 * Theory of Operation: Signed input reuses the real-valued Root; unsigned input
 *   cannot be negative so the odd-degree branch never applies.
 */
#include "terse/math/roots.h"

#include <cmath>
#include <limits>

namespace terse::math::detail {

double RootOfSigned(std::int64_t x, double degree, bool odd_degree) {
  if (degree == 0.0) {
    return std::numeric_limits<double>::quiet_NaN();
  }
  if (x == 0) {
    return 0.0;
  }
  const auto radicand = static_cast<double>(x);
  if (x < 0 && odd_degree) {
    return -std::pow(-radicand, 1.0 / degree);
  }
  return std::pow(radicand, 1.0 / degree);
}

double RootOfUnsigned(std::uint64_t x, double degree) {
  if (degree == 0.0) {
    return std::numeric_limits<double>::quiet_NaN();
  }
  if (x == 0U) {
    return 0.0;
  }
  return std::pow(static_cast<double>(x), 1.0 / degree);
}

}  // namespace terse::math::detail
