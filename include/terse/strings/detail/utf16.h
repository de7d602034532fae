/***
 * Name: terse::strings::detail (utf16)
 * Purpose: UTF-8 <-> UTF-16 conversion shared by the ICU-backed string helpers.
 * Inputs: UTF-8 text, or UTF-16 code units and their length
 * Outputs: Converted text via out-parameters; false on ICU failure
 * Theory of Operation: Preflight with a null buffer for the length, then
 *   convert into a buffer sized from it. Ill-formed UTF-8 becomes U+FFFD.
 */
#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <unicode/utypes.h>

namespace terse::strings::detail {

/*** Utf8ToUtf16: UTF-8 to UTF-16, substituting U+FFFD for ill-formed input. */
bool Utf8ToUtf16(std::string_view text, std::vector<UChar>& out);

/*** Utf16ToUtf8: UTF-16 back to UTF-8. */
bool Utf16ToUtf8(const UChar* data, int32_t len, std::string& out);

}  // namespace terse::strings::detail
