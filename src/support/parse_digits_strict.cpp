/***
 * Name: terse::support::ParseDigitsStrict
 * Purpose: Parse base-10 digits into an unsigned magnitude bounded by limit.
 * Inputs: text view (digits only), limit, out value, optional error string pointer
 * Outputs: value and status; err set on failure
 * Theory of Operation: Overflow is detected before each multiply-add so the
 *   accumulator never wraps.
 */
#include "terse/support/parse_util.h"

#include <cctype>
#include <string>
#include <string_view>

namespace terse {
namespace support {

auto ParseDigitsStrict(std::string_view text, std::uint64_t limit, std::uint64_t& value, std::string* err) -> bool {
  value = 0;
  constexpr std::uint64_t kBase10 = 10;
  constexpr char kZeroChar = '0';
  std::string local_err;
  if (text.empty()) {
    local_err = "invalid integer literal";
  }
  for (const char digit_char : text) {
    if (!local_err.empty()) {
      break;
    }
    if (std::isdigit(static_cast<unsigned char>(digit_char)) == 0) {
      local_err = "invalid character in integer literal";
      break;
    }
    const auto digit = static_cast<std::uint64_t>(digit_char - kZeroChar);
    if (value > (limit - digit) / kBase10) {
      local_err = "integer overflow";
      break;
    }
    value = (value * kBase10) + digit;
  }
  if (!local_err.empty()) {
    if (err != nullptr) {
      *err = local_err;
    }
    return false;
  }
  return true;
}

}  // namespace support
}  // namespace terse
