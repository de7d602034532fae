/***
 * Name: terse::strings::detail::Utf8ToUtf16
 * Purpose: Convert UTF-8 bytes to a UTF-16 buffer for ICU.
 * Inputs: text (UTF-8, possibly ill-formed)
 * Outputs: out filled with UTF-16 code units (no terminator); true on success
 * Theory of Operation: Preflight for the length, then convert with U+FFFD
 *   substitution so malformed bytes never abort the conversion.
 */
#include "terse/strings/detail/utf16.h"

#include <unicode/ustring.h>

namespace terse::strings::detail {

bool Utf8ToUtf16(std::string_view text, std::vector<UChar>& out) {
  out.clear();
  if (text.empty()) {
    return true;
  }
  const auto nb = static_cast<int32_t>(text.size());
  UErrorCode status = U_ZERO_ERROR;
  int32_t uLen = 0;
  u_strFromUTF8WithSub(nullptr, 0, &uLen, text.data(), nb, 0xFFFD, nullptr, &status);
  if (status != U_BUFFER_OVERFLOW_ERROR && U_FAILURE(status)) {
    return false;
  }
  status = U_ZERO_ERROR;
  out.resize(static_cast<std::size_t>(uLen) + 1);
  u_strFromUTF8WithSub(out.data(), uLen + 1, nullptr, text.data(), nb, 0xFFFD, nullptr, &status);
  if (U_FAILURE(status)) {
    out.clear();
    return false;
  }
  out.resize(static_cast<std::size_t>(uLen));
  return true;
}

}  // namespace terse::strings::detail
