/***
 * Name: terse::support (parse)
 * Purpose: Strict parsing of numeric command-line arguments without throwing.
 * Inputs: Text containing an optional sign and a number; optional error out
 * Outputs: Parsed value via out param; returns true on success
 * Theory of Operation: Surrounding whitespace is ignored; any other trailing
 *   character is an error. Real numbers accept decimal and exponent forms as
 *   well as "nan", "inf" and "infinity".
 */
#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace terse {
namespace support {

bool ParseIntegerStrict(std::string_view text, std::int64_t& out_val, std::string* err = nullptr);

bool ParseRealStrict(std::string_view text, double& out_val, std::string* err = nullptr);

}  // namespace support
}  // namespace terse
