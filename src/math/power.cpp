/***
 * Name: terse::math::Power
 * Purpose: Raise a base to an arbitrary real exponent.
 * Inputs: base, exponent
 * Outputs: pow(base, exponent)
 * Theory of Operation: Direct pow; domain errors surface as NaN.
 */
#include "terse/math/powers.h"

#include <cmath>

namespace terse::math {

double Power(double base, double exponent) { return std::pow(base, exponent); }

}  // namespace terse::math
