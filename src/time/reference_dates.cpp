/***
 * Name: terse::time::Epoch / ReferenceDate
 * Purpose: Fixed anchor dates.
 * Inputs: none
 * Outputs: 1970-01-01T00:00:00Z and 2001-01-01T00:00:00Z as system_clock time points
 * Theory of Operation: The default-constructed system_clock time point is the
 *   epoch; the reference date is a whole number of seconds after it.
 */
#include "terse/time/dates.h"

namespace terse::time {

Date Epoch() { return Date{}; }

Date ReferenceDate() {
  return Epoch() + std::chrono::seconds(static_cast<std::chrono::seconds::rep>(kTimeIntervalBetweenEpochAndReferenceDate));
}

}  // namespace terse::time
