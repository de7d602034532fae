/***
 * Name: terse::math::Root
 * Purpose: Principal n-th root of a real radicand.
 * Inputs:
 *   - x: radicand
 *   - n: degree (nonzero)
 * Outputs: x^(1/n), the negated real root for negative x and odd integer n,
 *   NaN for other negative radicands and for n == 0.
 * Theory of Operation: fmod(n, 2) has magnitude 1 exactly when n is an odd
 *   integer; only then is the sign pulled out before calling pow.
 */
#include "terse/math/roots.h"

#include <cmath>
#include <limits>

namespace terse::math {

double Root(double x, double n) {
  if (n == 0.0 || std::isnan(n)) {
    return std::numeric_limits<double>::quiet_NaN();
  }
  if (x == 0.0) {
    return 0.0;
  }
  if (x < 0.0 && std::fabs(std::fmod(n, 2.0)) == 1.0) {
    return -std::pow(-x, 1.0 / n);
  }
  return std::pow(x, 1.0 / n);
}

}  // namespace terse::math
