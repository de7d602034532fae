/***
 * Name: terse::math::SquareRoot / CubeRoot / FourthRoot
 * Purpose: Fixed-degree shorthands for Root.
 * Inputs: x radicand
 * Outputs: Root(x, 2), Root(x, 3), Root(x, 4)
 * Theory of Operation: Delegates to the general routine so every degree shares
 *   one sign policy.
 */
#include "terse/math/roots.h"

namespace terse::math {

double SquareRoot(double x) { return Root(x, 2.0); }

double CubeRoot(double x) { return Root(x, 3.0); }

double FourthRoot(double x) { return Root(x, 4.0); }

}  // namespace terse::math
