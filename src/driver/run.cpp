/***
 * Name: terse::driver::Run
 * Purpose: One complete terse-calc invocation.
 * Inputs: argc, argv, out, err
 * Outputs: Process status code (kExitOk, kExitNaN, kExitError)
 * Theory of Operation: Parse options (usage on failure), honor --help, run the
 *   command, print the result. terse exceptions become error reports; NaN
 *   results print normally but set kExitNaN.
 */
#include "terse/driver/app.h"

#include <cmath>
#include <ostream>
#include <string>

#include "terse/driver/cli.h"
#include "terse/exceptions/terse_exception.h"
#include "terse/strings/describe.h"

namespace terse::driver {

int Run(int argc, const char* const* argv, std::ostream& out, std::ostream& err) {
  const char* argv0 = (argv != nullptr && argc > 0) ? argv[0] : nullptr;
  CliOptions opts;
  if (!ParseCli(argc, argv, opts, err)) {
    PrintUsage(err, argv0);
    return kExitError;
  }
  if (opts.show_help) {
    PrintUsage(out, argv0);
    return kExitOk;
  }
  Trace(err, opts, "command '" + opts.command + "' operands " + strings::Describe(opts.operands));

  try {
    const CommandResult result = RunCommand(opts);
    WriteResult(out, result, opts);
    if (result.is_numeric && std::isnan(result.number)) {
      Trace(err, opts, "result is not a number");
      return kExitNaN;
    }
    return kExitOk;
  } catch (const exceptions::TerseException& ex) {
    ReportError(err, ex.what());
    return kExitError;
  }
}

}  // namespace terse::driver
