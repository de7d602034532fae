/***
 * Name: terse::driver::detail::NormalizeArgv
 * Purpose: Convert argv into a vector of strings, mapping null entries to "".
 * Inputs: argc, argv
 * Outputs: out (cleared and filled with argc entries)
 */
#include "terse/driver/cli_parse.h"

#include <string>
#include <vector>

namespace terse {
namespace driver {
namespace detail {

void NormalizeArgv(int argc, const char* const* argv, std::vector<std::string>& out) {
  out.clear();
  if (argv == nullptr || argc <= 0) {
    return;
  }
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    const char* item = argv[i];
    out.emplace_back(item != nullptr ? item : "");
  }
}

}  // namespace detail
}  // namespace driver
}  // namespace terse
