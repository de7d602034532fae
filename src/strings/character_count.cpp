/***
 * Name: terse::strings::CharacterCount
 * Purpose: Count user-perceived characters (extended grapheme clusters) in UTF-8 text.
 * Inputs: text (UTF-8)
 * Outputs: Number of grapheme clusters
 * Theory of Operation: Opens a UBRK_CHARACTER break iterator over the UTF-16
 *   form and counts boundaries after the first. If ICU cannot be used the
 *   count falls back to UTF-16 code units.
 */
#include "terse/strings/unicode.h"

#include <memory>
#include <vector>

#include <unicode/ubrk.h>

#include "terse/strings/detail/utf16.h"

namespace terse::strings {

std::size_t CharacterCount(std::string_view text) {
  std::vector<UChar> ustr;
  if (!detail::Utf8ToUtf16(text, ustr) || ustr.empty()) {
    return ustr.size();
  }
  UErrorCode status = U_ZERO_ERROR;
  std::unique_ptr<UBreakIterator, decltype(&ubrk_close)> iter(
      ubrk_open(UBRK_CHARACTER, "", ustr.data(), static_cast<int32_t>(ustr.size()), &status), &ubrk_close);
  if (U_FAILURE(status) || !iter) {
    return ustr.size();
  }
  std::size_t count = 0;
  ubrk_first(iter.get());
  while (ubrk_next(iter.get()) != UBRK_DONE) {
    ++count;
  }
  return count;
}

}  // namespace terse::strings
