/***
 * Name: terse::driver (cli_parse helpers)
 * Purpose: Declarations for small, single-purpose option handlers used by ParseCli.
 * Inputs: Argument string(s), index into args, CLI options destination, error stream
 * Outputs: detail::OptResult (NotMatched, Handled, Error)
 * Theory of Operation: Each function recognizes one category of options, mutates state,
 *   and advances the index where necessary, keeping ParseCli simple.
 */
#pragma once

#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "terse/driver/cli.h"

namespace terse {
namespace driver {
namespace detail {

/*** HandleHelpArg: Recognize -h/--help and set flag. */
OptResult HandleHelpArg(const std::string& arg, CliOptions& dst);

/*** HandleVerboseArg: Recognize -v/--verbose. */
OptResult HandleVerboseArg(const std::string& arg, CliOptions& dst);

/*** HandleFormatArg: Parse --format=text|json. */
OptResult HandleFormatArg(const std::string& arg, CliOptions& dst, std::ostream& err);

/*** HandlePrecisionArg: Parse --precision=<digits> (0..17). */
OptResult HandlePrecisionArg(const std::string& arg, CliOptions& dst, std::ostream& err);

/*** HandleEndOfOptions: Handle "--" and push the remaining tokens as positionals. */
OptResult HandleEndOfOptions(const std::vector<std::string>& args,
                             int& index,
                             int argc,
                             CliOptions& dst);

/*** HandleUnknownOrPositional: Error on unknown '-' options; otherwise record command/operand. */
OptResult HandleUnknownOrPositional(const std::string& arg, CliOptions& dst, std::ostream& err);

/*** AddPositional: First positional becomes the command, later ones operands. */
void AddPositional(const std::string& arg, CliOptions& dst);

/*** LooksNumeric: True for tokens such as -3, -.5 or -inf that must not be read as options. */
bool LooksNumeric(std::string_view arg);

/*** NormalizeArgv: Convert argv into vector<string> with null safety. */
void NormalizeArgv(int argc, const char* const* argv, std::vector<std::string>& out);

/*** RunHandlers: Execute ordered handlers for current arg index. */
OptResult RunHandlers(const std::vector<std::string>& args,
                      int& index,
                      int argc,
                      CliOptions& dst,
                      std::ostream& err);

}  // namespace detail
}  // namespace driver
}  // namespace terse
