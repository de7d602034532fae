/***
 * Name: terse::time (time interval conversions)
 * Purpose: Convert between dates and floating-point second offsets.
 * Inputs: Date, or seconds as double
 * Outputs: seconds as double, or Date
 * Theory of Operation: duration<double> carries fractional seconds; converting
 *   back to the clock's duration rounds to the nearest tick. Offsets are
 *   checked before that conversion: NaN yields the anchor date itself and
 *   values beyond the clock's range saturate to Date::min() or Date::max().
 */
#include "terse/time/dates.h"

#include <cmath>

namespace terse::time {

namespace {

using Seconds = std::chrono::duration<double>;

// One second of slack keeps the tick count clear of rounding into overflow.
constexpr double kSaturationSlack = 1.0;

Date FromEpochSeconds(double seconds) {
  const double max_seconds = std::chrono::duration_cast<Seconds>(Clock::duration::max()).count();
  const double min_seconds = std::chrono::duration_cast<Seconds>(Clock::duration::min()).count();
  if (seconds >= max_seconds - kSaturationSlack) {
    return Date::max();
  }
  if (seconds <= min_seconds + kSaturationSlack) {
    return Date::min();
  }
  return Epoch() + std::chrono::round<Clock::duration>(Seconds(seconds));
}

}  // namespace

double TimeIntervalSinceEpoch(Date date) {
  return std::chrono::duration_cast<Seconds>(date - Epoch()).count();
}

double TimeIntervalSinceEpoch() { return TimeIntervalSinceEpoch(Clock::now()); }

Date FromTimeIntervalSinceEpoch(double seconds) {
  if (std::isnan(seconds)) {
    return Epoch();
  }
  return FromEpochSeconds(seconds);
}

double TimeIntervalSinceReferenceDate(Date date) {
  return std::chrono::duration_cast<Seconds>(date - ReferenceDate()).count();
}

Date FromTimeIntervalSinceReferenceDate(double seconds) {
  if (std::isnan(seconds)) {
    return ReferenceDate();
  }
  return FromEpochSeconds(seconds + kTimeIntervalBetweenEpochAndReferenceDate);
}

}  // namespace terse::time
