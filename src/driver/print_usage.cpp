/***
 * Name: terse::driver::PrintUsage
 * Purpose: Print usage information for terse-calc.
 * Inputs:
 *   - out: Destination stream
 *   - argv0: Program name used in usage examples
 * Outputs: None
 * Theory of Operation: Renders the command list and supported flags.
 */
#include "terse/driver/cli.h"

#include <cstring>
#include <ostream>
#include <string_view>

namespace terse::driver {

static std::string_view Basename(const char* path) {
  if (path == nullptr || *path == '\0') {
    return std::string_view{"terse-calc"};
  }
  const char* last_slash = std::strrchr(path, '/');
  return std::string_view(last_slash != nullptr ? last_slash + 1 : path);
}

auto PrintUsage(std::ostream& out, const char* argv0) -> void {
  const std::string_view program_name = Basename(argv0);
  out << "Usage: " << program_name << " [options] <command> <operands...>" << '\n'
      << '\n'
      << "Commands:" << '\n'
      << "  root <x> <n>           n-th root of x (real roots of negatives for odd n)" << '\n'
      << "  sqrt <x>               square root" << '\n'
      << "  cbrt <x>               cube root" << '\n'
      << "  fourth-root <x>        fourth root" << '\n'
      << "  pow <base> <exponent>  base raised to exponent" << '\n'
      << "  sign <x>               -1, 0 or 1" << '\n'
      << "  parity <integer>       even or odd" << '\n'
      << '\n'
      << "Options:" << '\n'
      << "  -h, --help             Print this help and exit" << '\n'
      << "  -v, --verbose          Trace the parsed command on stderr" << '\n'
      << "  --format=text|json     Output format (default: text)" << '\n'
      << "  --precision=<digits>   Fixed-point digits instead of shortest form" << '\n'
      << "  --                     End of options" << '\n'
      << '\n'
      << "Exit status: 0 on success, 1 when the result is NaN, 2 on errors." << '\n';
}

}  // namespace terse::driver
