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
 * Theory of Operation:
 *   Normalizes argv, then runs the handler table on each token. Help stops
 *   parsing early; otherwise a command word is required.
 */
#include "terse/driver/cli.h"
#include "terse/driver/cli_parse.h"

#include <ostream>
#include <string>
#include <vector>

namespace terse::driver {

auto ParseCli(int argc, const char* const* argv, CliOptions& dst, std::ostream& err) -> bool {
  // Reset to defaults
  dst = CliOptions{};

  std::vector<std::string> args;
  detail::NormalizeArgv(argc, argv, args);

  const int count = static_cast<int>(args.size());
  for (int arg_index = 1; arg_index < count; ++arg_index) {
    if (detail::RunHandlers(args, arg_index, count, dst, err) == detail::OptResult::Error) {
      return false;
    }
    if (dst.show_help) {
      return true;
    }
  }

  if (dst.command.empty()) {
    err << "terse-calc: error: no command given" << '\n';
    return false;
  }
  return true;
}

}  // namespace terse::driver
