/***
 * Name: terse::driver::ReportError / Trace
 * Purpose: Uniform diagnostic lines for terse-calc.
 * Inputs: err stream, message (and options for Trace)
 * Outputs: "terse-calc: error: ..." always; "terse-calc: trace: ..." only with --verbose
 */
#include "terse/driver/app.h"

#include <ostream>
#include <string>

namespace terse::driver {

void ReportError(std::ostream& err, const std::string& message) {
  err << "terse-calc: error: " << message << '\n';
}

void Trace(std::ostream& err, const CliOptions& opts, const std::string& message) {
  if (opts.verbose) {
    err << "terse-calc: trace: " << message << '\n';
  }
}

}  // namespace terse::driver
