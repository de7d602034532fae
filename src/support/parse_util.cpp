/***
 * Name: terse::support::TrimSpaces / ConsumeSign
 * Purpose: Whitespace trimming and sign consumption for the strict parsers.
 * Inputs: text (by ref), is_negative (by ref)
 * Outputs: text narrowed; is_negative set when a sign is consumed
 */
#include "terse/support/parse_util.h"

#include <cctype>
#include <string_view>

namespace terse::support {

void TrimSpaces(std::string_view& text) {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())) != 0) {
    text.remove_prefix(1);
  }
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())) != 0) {
    text.remove_suffix(1);
  }
}

void ConsumeSign(std::string_view& text, bool& is_negative) {
  is_negative = false;
  if (!text.empty() && (text[0] == '+' || text[0] == '-')) {
    is_negative = (text[0] == '-');
    text.remove_prefix(1);
  }
}

}  // namespace terse::support
