/***
 * Name: terse::driver::detail::HandleHelpArg / HandleVerboseArg
 * Purpose: Recognize the boolean switches -h/--help and -v/--verbose.
 * Inputs: current arg, destination options
 * Outputs: Handled when matched, otherwise NotMatched
 * Theory of Operation: No error cases.
 */
#include "terse/driver/cli_parse.h"
#include "terse/driver/cli.h"

#include <string>

namespace terse {
namespace driver {
namespace detail {

auto HandleHelpArg(const std::string& arg, CliOptions& dst) -> OptResult {
  if (arg == "-h" || arg == "--help") {
    dst.show_help = true;
    return OptResult::Handled;
  }
  return OptResult::NotMatched;
}

auto HandleVerboseArg(const std::string& arg, CliOptions& dst) -> OptResult {
  if (arg == "-v" || arg == "--verbose") {
    dst.verbose = true;
    return OptResult::Handled;
  }
  return OptResult::NotMatched;
}

}  // namespace detail
}  // namespace driver
}  // namespace terse
