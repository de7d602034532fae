/***
 * Name: terse::strings::Lowercased / Uppercased
 * Purpose: Full Unicode case mapping of UTF-8 text.
 * Inputs: text (UTF-8)
 * Outputs: Mapped UTF-8 string; the input unchanged if ICU reports a failure
 * Theory of Operation: UTF-8 -> UTF-16, u_strToLower/u_strToUpper with the
 *   root locale (preflight, then map), UTF-16 -> UTF-8.
 */
#include "terse/strings/unicode.h"

#include <vector>

#include <unicode/ustring.h>

#include "terse/strings/detail/utf16.h"

namespace terse::strings {

namespace {

using CaseMapFn = int32_t (*)(UChar*, int32_t, const UChar*, int32_t, const char*, UErrorCode*);

std::string MapCase(std::string_view text, CaseMapFn map_fn) {
  std::vector<UChar> ustr;
  if (!detail::Utf8ToUtf16(text, ustr)) {
    return std::string(text);
  }
  const auto uLen = static_cast<int32_t>(ustr.size());
  UErrorCode status = U_ZERO_ERROR;
  const int32_t mLen = map_fn(nullptr, 0, ustr.data(), uLen, "", &status);
  if (status != U_BUFFER_OVERFLOW_ERROR && U_FAILURE(status)) {
    return std::string(text);
  }
  status = U_ZERO_ERROR;
  std::vector<UChar> mapped(static_cast<std::size_t>(mLen) + 1);
  map_fn(mapped.data(), mLen + 1, ustr.data(), uLen, "", &status);
  if (U_FAILURE(status)) {
    return std::string(text);
  }
  std::string out;
  if (!detail::Utf16ToUtf8(mapped.data(), mLen, out)) {
    return std::string(text);
  }
  return out;
}

}  // namespace

std::string Lowercased(std::string_view text) { return MapCase(text, &u_strToLower); }

std::string Uppercased(std::string_view text) { return MapCase(text, &u_strToUpper); }

}  // namespace terse::strings
