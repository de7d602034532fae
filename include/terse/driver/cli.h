/***
 * Name: terse::driver (cli)
 * Purpose: Declarations for terse-calc options, parsing, and usage printing.
 * Inputs: N/A (declarations only)
 * Outputs: Types and functions for CLI handling.
 * Theory of Operation: terse-calc takes options, a command word and the
 *   command's operands. Definitions live in .cpp files.
 */
#pragma once

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace terse {
namespace driver {

/***
 * Name: terse::driver::CliOptions
 * Purpose: Hold parsed command-line options for a terse-calc invocation.
 * Inputs: Values are populated by ParseCli.
 * Outputs: Consumed by RunCommand and WriteResult.
 * Theory of Operation: The first positional token is the command; the rest
 *   are its operands, kept as text until the command validates them.
 */
struct CliOptions {
  std::string command;                // root, sqrt, cbrt, fourth-root, pow, sign, parity
  std::vector<std::string> operands;  // command arguments, unparsed
  bool show_help = false;             // -h, --help
  bool verbose = false;               // -v, --verbose
  enum class OutputFormat { Text, Json };
  OutputFormat format = OutputFormat::Text;  // --format=text|json
  std::optional<int> precision;              // --precision=<digits>
};

namespace detail {
enum class OptResult { NotMatched, Handled, Error };
}

/***
 * Name: terse::driver::ParseCli
 * Purpose: Parse command-line arguments into a CliOptions structure.
 * Inputs:
 *   - argc: Argument count
 *   - argv: Argument vector
 *   - dst: Output options structure to populate
 *   - err: Stream for diagnostics on parse errors
 * Outputs:
 *   - bool: true on successful parse, false if an error occurs
 * Theory of Operation: Iterates arguments left-to-right through a table of
 *   small handlers. Unknown options cause failure with a message. Tokens that
 *   look like negative numbers are positional, not options.
 */
bool ParseCli(int argc, const char* const* argv, CliOptions& dst, std::ostream& err);

/***
 * Name: terse::driver::PrintUsage
 * Purpose: Print usage information for terse-calc.
 * Inputs:
 *   - out: Destination stream
 *   - argv0: Program name used in usage examples
 * Outputs: None
 */
void PrintUsage(std::ostream& out, const char* argv0);

}  // namespace driver
}  // namespace terse
