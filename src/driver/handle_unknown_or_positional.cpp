/***
 * Name: terse::driver::detail::HandleUnknownOrPositional
 * Purpose: Treat tokens beginning with '-' (not matched by previous handlers) as errors
 *          unless they read as negative numbers; otherwise record a positional.
 * Inputs:
 *   - arg: current argument string
 *   - dst: CLI options destination
 *   - err: error stream
 * Outputs: OptResult::Error for unknown option, OptResult::Handled otherwise.
 * Theory of Operation: This is the last handler evaluated by RunHandlers; it ensures
 *   every token is either handled as a positional or rejected.
 */
#include "terse/driver/cli_parse.h"
#include "terse/driver/cli.h"

#include <cctype>
#include <ostream>
#include <string>
#include <string_view>

namespace terse {
namespace driver {
namespace detail {

auto LooksNumeric(std::string_view arg) -> bool {
  if (arg.size() < 2 || arg[0] != '-') {
    return false;
  }
  const char next = arg[1];
  return std::isdigit(static_cast<unsigned char>(next)) != 0 || next == '.' || arg == "-inf" ||
         arg == "-infinity" || arg == "-nan";
}

void AddPositional(const std::string& arg, CliOptions& dst) {
  if (dst.command.empty()) {
    dst.command = arg;
  } else {
    dst.operands.push_back(arg);
  }
}

auto HandleUnknownOrPositional(const std::string& arg, CliOptions& dst, std::ostream& err) -> OptResult {
  if (!arg.empty() && arg[0] == '-' && !LooksNumeric(arg)) {
    err << "terse-calc: error: unknown option '" << arg << "'" << '\n';
    return OptResult::Error;
  }
  if (!arg.empty()) {
    AddPositional(arg, dst);
  }
  return OptResult::Handled;
}

}  // namespace detail
}  // namespace driver
}  // namespace terse
