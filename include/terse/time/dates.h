/***
 * Name: terse::time (dates)
 * Purpose: Reference dates and conversions between time points and second counts.
 * Inputs: system_clock time points, or seconds as double
 * Outputs: Time points, or seconds as double
 * Theory of Operation:
 *   Dates are std::chrono::system_clock time points, which count from the
 *   Unix epoch (1970-01-01T00:00:00Z). The reference date is
 *   2001-01-01T00:00:00Z, 978307200 seconds after the epoch. Fractional
 *   seconds round to the clock's native resolution. Converting NaN seconds
 *   yields the anchor date (Epoch() or ReferenceDate()); offsets outside the
 *   clock's range saturate to Date::min() or Date::max().
 */
#pragma once

#include <chrono>

namespace terse {
namespace time {

using Clock = std::chrono::system_clock;
using Date = Clock::time_point;

inline constexpr double kTimeIntervalBetweenEpochAndReferenceDate = 978307200.0;

Date Epoch();

Date ReferenceDate();

/*** TimeIntervalSinceEpoch: seconds from the Unix epoch to date (negative before it). */
double TimeIntervalSinceEpoch(Date date);

/*** TimeIntervalSinceEpoch: seconds from the Unix epoch to now. */
double TimeIntervalSinceEpoch();

Date FromTimeIntervalSinceEpoch(double seconds);

double TimeIntervalSinceReferenceDate(Date date);

Date FromTimeIntervalSinceReferenceDate(double seconds);

}  // namespace time
}  // namespace terse
