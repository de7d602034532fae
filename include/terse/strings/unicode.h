/***
 * Name: terse::strings (unicode)
 * Purpose: Unicode-aware case mapping and character counting for UTF-8 text.
 * Inputs: UTF-8 encoded std::string_view
 * Outputs: Case-mapped UTF-8 strings; counts of user-perceived characters
 * Theory of Operation:
 *   Text is converted to UTF-16 with ICU, ill-formed bytes replaced by
 *   U+FFFD. Case mapping uses the root locale's full mappings (so "ß"
 *   uppercases to "SS"). CharacterCount walks extended grapheme cluster
 *   boundaries with an ICU character break iterator, so "e" followed by a
 *   combining accent counts once.
 */
#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace terse {
namespace strings {

std::string Lowercased(std::string_view text);

std::string Uppercased(std::string_view text);

std::size_t CharacterCount(std::string_view text);

}  // namespace strings
}  // namespace terse
