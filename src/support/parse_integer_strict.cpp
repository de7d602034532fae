/***
 * Name: terse::support::ParseIntegerStrict
 * Purpose: Parse a base-10 signed 64-bit integer without throwing; fail on extra tokens.
 * Inputs:
 *   - text: string view of the literal
 * Outputs:
 *   - out_val: parsed integer on success
 *   - err: optional error message on failure
 * Theory of Operation: Trim, consume the sign, then parse the magnitude with a
 *   limit one larger for negative values so INT64_MIN is accepted.
 */
#include "terse/support/parse.h"

#include <limits>

#include "terse/support/parse_util.h"

namespace terse::support {

auto ParseIntegerStrict(std::string_view text, std::int64_t& out_val, std::string* err) -> bool {
  TrimSpaces(text);
  bool is_negative = false;
  ConsumeSign(text, is_negative);

  constexpr auto kMax = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
  std::uint64_t magnitude = 0;
  if (!ParseDigitsStrict(text, is_negative ? kMax + 1 : kMax, magnitude, err)) {
    return false;
  }
  if (is_negative) {
    out_val = (magnitude == kMax + 1) ? std::numeric_limits<std::int64_t>::min()
                                      : -static_cast<std::int64_t>(magnitude);
  } else {
    out_val = static_cast<std::int64_t>(magnitude);
  }
  return true;
}

}  // namespace terse::support
