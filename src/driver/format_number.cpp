/***
 * Name: terse::driver::FormatNumber
 * Purpose: Render a numeric result for output.
 * Inputs: value, opts (precision)
 * Outputs: Text form of value
 * Theory of Operation: Without --precision the shortest round-trip form from
 *   strings::Describe is used. With it, finite values print in fixed notation;
 *   NaN and infinities keep their Describe spelling.
 */
#include "terse/driver/app.h"

#include <cmath>
#include <ios>
#include <sstream>
#include <string>

#include "terse/strings/describe.h"

namespace terse::driver {

std::string FormatNumber(double value, const CliOptions& opts) {
  if (!opts.precision.has_value() || !std::isfinite(value)) {
    return strings::Describe(value);
  }
  std::ostringstream stream;
  stream << std::fixed;
  stream.precision(*opts.precision);
  stream << value;
  return stream.str();
}

}  // namespace terse::driver
