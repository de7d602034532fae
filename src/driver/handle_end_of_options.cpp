/***
 * Name: terse::driver::detail::HandleEndOfOptions
 * Purpose: Handle "--": every later token is positional, even if it starts with '-'.
 * Inputs: args, index (in/out), argc, dst
 * Outputs: Handled when "--" is seen (index moved to the last argument), otherwise NotMatched
 */
#include "terse/driver/cli_parse.h"
#include "terse/driver/cli.h"

#include <cstddef>
#include <string>
#include <vector>

namespace terse {
namespace driver {
namespace detail {

auto HandleEndOfOptions(const std::vector<std::string>& args,
                        int& index,
                        int argc,
                        CliOptions& dst) -> OptResult {
  if (args[static_cast<std::size_t>(index)] != "--") {
    return OptResult::NotMatched;
  }
  for (++index; index < argc; ++index) {
    AddPositional(args[static_cast<std::size_t>(index)], dst);
  }
  index = argc - 1;
  return OptResult::Handled;
}

}  // namespace detail
}  // namespace driver
}  // namespace terse
