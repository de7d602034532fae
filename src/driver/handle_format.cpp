/***
 * Name: terse::driver::detail::HandleFormatArg
 * Purpose: Handle the --format=text|json option.
 * Inputs:
 *   - arg: current argument string
 *   - dst: CLI options destination
 *   - err: error stream
 * Outputs: OptResult indicating match and success/failure
 * Theory of Operation: Recognizes the "--format=" prefix and validates the value.
 */
#include "terse/driver/cli_parse.h"
#include "terse/driver/cli.h"

#include <ostream>
#include <string>
#include <string_view>

namespace terse {
namespace driver {
namespace detail {

auto HandleFormatArg(const std::string& arg, CliOptions& dst, std::ostream& err) -> OptResult {
  constexpr std::string_view kPrefix{"--format="};
  if (arg.rfind(kPrefix, 0) != 0U) {
    return OptResult::NotMatched;
  }
  const std::string value = arg.substr(kPrefix.size());
  if (value == "json") {
    dst.format = CliOptions::OutputFormat::Json;
  } else if (value == "text") {
    dst.format = CliOptions::OutputFormat::Text;
  } else {
    err << "terse-calc: error: unknown output format '" << value << "' (expected json or text)" << '\n';
    return OptResult::Error;
  }
  return OptResult::Handled;
}

}  // namespace detail
}  // namespace driver
}  // namespace terse
