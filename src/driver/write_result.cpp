/***
 * Name: terse::driver::WriteResult
 * Purpose: Print a CommandResult as text or JSON.
 * Inputs: out stream, result, opts (format, precision)
 * Outputs: One line on out
 * Theory of Operation:
 *   Text prints the bare value. JSON prints
 *   {"command": ..., "operands": [...], "result": ...} with the result as a
 *   JSON number when finite and as a string ("nan", "inf", "even") otherwise,
 *   since JSON has no NaN or infinity literals. Strings are escaped per JSON:
 *   quotes, backslashes and control bytes (short escapes or \u00XX).
 */
#include "terse/driver/app.h"

#include <cmath>
#include <cstddef>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <string>

namespace terse::driver {

namespace {

std::string Quote(const std::string& text) {
  std::string out = "\"";
  constexpr std::size_t kReservePadding = 8;
  out.reserve(text.size() + kReservePadding);
  for (const unsigned char uchar : text) {
    switch (uchar) {
      case '"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\b': out += "\\b"; break;
      case '\f': out += "\\f"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        constexpr unsigned char kMinPrintable = 0x20;
        if (uchar < kMinPrintable) {
          std::ostringstream hex;
          hex << "\\u" << std::hex << std::uppercase << std::setw(4) << std::setfill('0')
              << static_cast<int>(uchar);
          out += hex.str();
        } else {
          out += static_cast<char>(uchar);
        }
    }
  }
  out.push_back('"');
  return out;
}

}  // namespace

void WriteResult(std::ostream& out, const CommandResult& result, const CliOptions& opts) {
  const std::string value = result.is_numeric ? FormatNumber(result.number, opts) : result.text;
  if (opts.format == CliOptions::OutputFormat::Text) {
    out << value << '\n';
    return;
  }
  out << "{\"command\": " << Quote(result.command) << ", \"operands\": [";
  for (std::size_t i = 0; i < result.operands.size(); ++i) {
    if (i != 0) out << ", ";
    out << Quote(result.operands[i]);
  }
  out << "], \"result\": ";
  if (result.is_numeric && std::isfinite(result.number)) {
    out << value;
  } else {
    out << Quote(value);
  }
  out << "}" << '\n';
}

}  // namespace terse::driver
