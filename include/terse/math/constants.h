/***
 * Name: terse::math (constants)
 * Purpose: Mathematical constants and common vulgar fractions as doubles.
 * Inputs: N/A
 * Outputs: constexpr double values
 * Theory of Operation: Each fraction is the double division it names, so
 *   kOneThird == 1.0 / 3.0 holds exactly.
 */
#pragma once

#include <numbers>

namespace terse {
namespace math {

inline constexpr double kPi = std::numbers::pi;
inline constexpr double kE = std::numbers::e;

inline constexpr double kOneHalf = 1.0 / 2.0;
inline constexpr double kOneThird = 1.0 / 3.0;
inline constexpr double kTwoThirds = 2.0 / 3.0;
inline constexpr double kOneQuarter = 1.0 / 4.0;
inline constexpr double kThreeQuarters = 3.0 / 4.0;
inline constexpr double kOneFifth = 1.0 / 5.0;
inline constexpr double kTwoFifths = 2.0 / 5.0;
inline constexpr double kThreeFifths = 3.0 / 5.0;
inline constexpr double kFourFifths = 4.0 / 5.0;
inline constexpr double kOneSixth = 1.0 / 6.0;
inline constexpr double kFiveSixths = 5.0 / 6.0;
inline constexpr double kOneEighth = 1.0 / 8.0;
inline constexpr double kThreeEighths = 3.0 / 8.0;
inline constexpr double kFiveEighths = 5.0 / 8.0;
inline constexpr double kSevenEighths = 7.0 / 8.0;

}  // namespace math
}  // namespace terse
