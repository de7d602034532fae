/***
 * Name: terse::support::ParseRealStrict
 * Purpose: Parse a real number without throwing; fail on extra tokens.
 * Inputs:
 *   - text: string view of the literal
 * Outputs:
 *   - out_val: parsed value on success
 *   - err: optional error message on failure
 * Theory of Operation: std::from_chars in general format after consuming an
 *   optional sign (from_chars rejects a leading '+'). The whole trimmed view
 *   must be consumed.
 */
#include "terse/support/parse.h"

#include <charconv>
#include <system_error>

#include "terse/support/parse_util.h"

namespace terse::support {

auto ParseRealStrict(std::string_view text, double& out_val, std::string* err) -> bool {
  TrimSpaces(text);
  bool is_negative = false;
  ConsumeSign(text, is_negative);
  if (text.empty() || text[0] == '+' || text[0] == '-') {
    if (err != nullptr) {
      *err = "invalid real literal";
    }
    return false;
  }
  double value = 0.0;
  const char* const end = text.data() + text.size();
  const auto result = std::from_chars(text.data(), end, value, std::chars_format::general);
  if (result.ec == std::errc::result_out_of_range) {
    if (err != nullptr) {
      *err = "real literal out of range";
    }
    return false;
  }
  if (result.ec != std::errc{} || result.ptr != end) {
    if (err != nullptr) {
      *err = "invalid character in real literal";
    }
    return false;
  }
  out_val = is_negative ? -value : value;
  return true;
}

}  // namespace terse::support
