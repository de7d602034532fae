/***
 * Name: terse::strings::detail::Utf16ToUtf8
 * Purpose: Convert a UTF-16 buffer produced by ICU back to UTF-8.
 * Inputs: data, len (code units)
 * Outputs: out UTF-8 string; true on success
 * Theory of Operation: Preflight then convert, as in Utf8ToUtf16.
 */
#include "terse/strings/detail/utf16.h"

#include <unicode/ustring.h>

namespace terse::strings::detail {

bool Utf16ToUtf8(const UChar* data, int32_t len, std::string& out) {
  out.clear();
  if (len == 0) {
    return true;
  }
  UErrorCode status = U_ZERO_ERROR;
  int32_t outLen = 0;
  u_strToUTF8(nullptr, 0, &outLen, data, len, &status);
  if (status != U_BUFFER_OVERFLOW_ERROR && U_FAILURE(status)) {
    return false;
  }
  status = U_ZERO_ERROR;
  std::vector<char> buffer(static_cast<std::size_t>(outLen) + 1);
  u_strToUTF8(buffer.data(), outLen + 1, nullptr, data, len, &status);
  if (U_FAILURE(status)) {
    return false;
  }
  out.assign(buffer.data(), static_cast<std::size_t>(outLen));
  return true;
}

}  // namespace terse::strings::detail
