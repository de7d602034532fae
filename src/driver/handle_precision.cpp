/***
 * Name: terse::driver::detail::HandlePrecisionArg
 * Purpose: Handle --precision=<digits>.
 * Inputs:
 *   - arg: current argument string
 *   - dst: CLI options destination
 *   - err: error stream
 * Outputs: OptResult indicating match and success/failure
 * Theory of Operation: The digit count is parsed strictly and must lie in
 *   [0, 17], enough to print any double exactly in fixed notation's fraction.
 */
#include "terse/driver/cli_parse.h"
#include "terse/driver/cli.h"

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>

#include "terse/support/parse.h"

namespace terse {
namespace driver {
namespace detail {

namespace {
constexpr std::int64_t kMaxPrecision = 17;
}

auto HandlePrecisionArg(const std::string& arg, CliOptions& dst, std::ostream& err) -> OptResult {
  constexpr std::string_view kPrefix{"--precision="};
  if (arg.rfind(kPrefix, 0) != 0U) {
    return OptResult::NotMatched;
  }
  const std::string_view value = std::string_view(arg).substr(kPrefix.size());
  std::int64_t digits = 0;
  std::string parse_err;
  if (!support::ParseIntegerStrict(value, digits, &parse_err)) {
    err << "terse-calc: error: invalid precision '" << value << "': " << parse_err << '\n';
    return OptResult::Error;
  }
  if (digits < 0 || digits > kMaxPrecision) {
    err << "terse-calc: error: precision must be between 0 and " << kMaxPrecision << '\n';
    return OptResult::Error;
  }
  dst.precision = static_cast<int>(digits);
  return OptResult::Handled;
}

}  // namespace detail
}  // namespace driver
}  // namespace terse
