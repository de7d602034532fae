/***
 * Name: terse::driver::detail::RunHandlers
 * Purpose: Execute the ordered handler list for argument at 'index'.
 * Inputs: args, index (in/out), argc, dst, err
 * Outputs: OptResult (Error halts, Handled continues)
 * Theory of Operation: Table-driven dispatch; last handler captures unknown/positional.
 */
#include "terse/driver/cli_parse.h"
#include "terse/driver/cli.h"

#include <array>
#include <cstddef>
#include <functional>
#include <ostream>
#include <string>
#include <vector>

namespace terse {
namespace driver {
namespace detail {

auto RunHandlers(const std::vector<std::string>& args,
                 int& index,
                 int argc,
                 CliOptions& dst,
                 std::ostream& err) -> OptResult {
  using HandlerFn = std::function<OptResult(int&)>;

  const std::array handlers{
      HandlerFn{[&](int& idx) { return HandleHelpArg(args[static_cast<std::size_t>(idx)], dst); }},
      HandlerFn{[&](int& idx) { return HandleVerboseArg(args[static_cast<std::size_t>(idx)], dst); }},
      HandlerFn{[&](int& idx) { return HandleFormatArg(args[static_cast<std::size_t>(idx)], dst, err); }},
      HandlerFn{[&](int& idx) { return HandlePrecisionArg(args[static_cast<std::size_t>(idx)], dst, err); }},
      HandlerFn{[&](int& idx) { return HandleEndOfOptions(args, idx, argc, dst); }},
      HandlerFn{[&](int& idx) {
        return HandleUnknownOrPositional(args[static_cast<std::size_t>(idx)], dst, err);
      }},
  };

  for (const auto& handler : handlers) {
    const OptResult result = handler(index);
    if (result != OptResult::NotMatched) {
      return result;
    }
  }
  return OptResult::NotMatched;
}

}  // namespace detail
}  // namespace driver
}  // namespace terse
