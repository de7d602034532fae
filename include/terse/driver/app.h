/***
 * Name: terse::driver (app API)
 * Purpose: Declarations for the terse-calc command runner used by main().
 * Inputs: CLI options, output and error streams
 * Outputs: CommandResult values, formatted output, status codes
 * Theory of Operation: Keep main() minimal by factoring the work into
 *   separate translation units; one function per .cpp file.
 */
#pragma once

#include <iosfwd>
#include <string>
#include <vector>

#include "terse/driver/cli.h"

namespace terse {
namespace driver {

/*** Process status codes returned by Run. */
inline constexpr int kExitOk = 0;
inline constexpr int kExitNaN = 1;
inline constexpr int kExitError = 2;

/***
 * Name: terse::driver::CommandResult
 * Purpose: Outcome of one terse-calc command.
 * Inputs: Produced by RunCommand.
 * Outputs: Rendered by WriteResult.
 * Theory of Operation: Numeric commands keep the raw double so formatting can
 *   honor --precision; word results (parity) are stored as text.
 */
struct CommandResult {
  std::string command;
  std::vector<std::string> operands;
  bool is_numeric = true;
  double number = 0.0;
  std::string text;
};

/***
 * Name: terse::driver::RunCommand
 * Purpose: Evaluate the command named in opts.
 * Inputs: opts (command and operands)
 * Outputs: CommandResult
 * Theory of Operation: Validates arity and parses operands strictly, then
 *   dispatches to the terse::math helpers. Throws exceptions::ConfigError for
 *   an unknown command, a wrong operand count or an unparsable operand.
 *   Numeric domain errors are not errors here: they come back as NaN.
 */
CommandResult RunCommand(const CliOptions& opts);

/*** FormatNumber: Describe(value), or fixed notation with opts.precision digits. */
std::string FormatNumber(double value, const CliOptions& opts);

/*** WriteResult: Render a result as a text line or a JSON object line. */
void WriteResult(std::ostream& out, const CommandResult& result, const CliOptions& opts);

/*** ReportError: Print "terse-calc: error: <message>" to err. */
void ReportError(std::ostream& err, const std::string& message);

/*** Trace: Print "terse-calc: trace: <message>" to err when opts.verbose is set. */
void Trace(std::ostream& err, const CliOptions& opts, const std::string& message);

/***
 * Name: terse::driver::Run
 * Purpose: Full terse-calc invocation: parse, evaluate, print.
 * Inputs: argc, argv, out (results), err (diagnostics)
 * Outputs: kExitOk, kExitNaN when the result is NaN, kExitError on usage or
 *   operand errors
 */
int Run(int argc, const char* const* argv, std::ostream& out, std::ostream& err);

}  // namespace driver
}  // namespace terse
