/***
 * Name: terse::support (parse_util)
 * Purpose: Small helpers for parsing string_view inputs.
 * Inputs: std::string_view by reference, outputs via refs/pointers
 * Outputs: Mutated views and status booleans
 * Theory of Operation: Used to keep the strict parsers simple and readable.
 */
#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace terse {
namespace support {

/*** TrimSpaces: Remove leading and trailing ASCII whitespace from view. */
void TrimSpaces(std::string_view& text);

/*** ConsumeSign: If + or -, consume and set is_negative accordingly. */
void ConsumeSign(std::string_view& text, bool& is_negative);

/*** ParseDigitsStrict: Parse base-10 digits into a magnitude no larger than limit; set err on failure. */
bool ParseDigitsStrict(std::string_view text, std::uint64_t limit, std::uint64_t& value, std::string* err);

}  // namespace support
}  // namespace terse
