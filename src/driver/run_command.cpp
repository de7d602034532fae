/***
 * Name: terse::driver::RunCommand
 * Purpose: Evaluate one terse-calc command.
 * Inputs: opts (command word and text operands)
 * Outputs: CommandResult with a numeric or word result
 * Theory of Operation:
 *   Each command declares its operand count and whether operands are real or
 *   integer. Operands are parsed strictly; failures raise ConfigError with the
 *   offending token. Root and power domain errors propagate as NaN.
 */
#include "terse/driver/app.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "terse/exceptions/config_error.h"
#include "terse/math/parity.h"
#include "terse/math/powers.h"
#include "terse/math/roots.h"
#include "terse/math/signs.h"
#include "terse/support/parse.h"

namespace terse::driver {

namespace {

void RequireArity(const CliOptions& opts, std::size_t expected) {
  if (opts.operands.size() != expected) {
    throw exceptions::ConfigError("'" + opts.command + "' expects " + std::to_string(expected) +
                                  (expected == 1 ? " operand" : " operands") + ", got " +
                                  std::to_string(opts.operands.size()));
  }
}

double RealOperand(const CliOptions& opts, std::size_t index) {
  double value = 0.0;
  std::string err;
  if (!support::ParseRealStrict(opts.operands[index], value, &err)) {
    throw exceptions::ConfigError("bad operand '" + opts.operands[index] + "' for '" + opts.command + "': " + err);
  }
  return value;
}

std::int64_t IntegerOperand(const CliOptions& opts, std::size_t index) {
  std::int64_t value = 0;
  std::string err;
  if (!support::ParseIntegerStrict(opts.operands[index], value, &err)) {
    throw exceptions::ConfigError("bad operand '" + opts.operands[index] + "' for '" + opts.command + "': " + err);
  }
  return value;
}

}  // namespace

CommandResult RunCommand(const CliOptions& opts) {
  CommandResult result;
  result.command = opts.command;
  result.operands = opts.operands;

  const std::string& cmd = opts.command;
  if (cmd == "root") {
    RequireArity(opts, 2);
    result.number = math::Root(RealOperand(opts, 0), RealOperand(opts, 1));
  } else if (cmd == "sqrt") {
    RequireArity(opts, 1);
    result.number = math::SquareRoot(RealOperand(opts, 0));
  } else if (cmd == "cbrt") {
    RequireArity(opts, 1);
    result.number = math::CubeRoot(RealOperand(opts, 0));
  } else if (cmd == "fourth-root") {
    RequireArity(opts, 1);
    result.number = math::FourthRoot(RealOperand(opts, 0));
  } else if (cmd == "pow") {
    RequireArity(opts, 2);
    result.number = math::Power(RealOperand(opts, 0), RealOperand(opts, 1));
  } else if (cmd == "sign") {
    RequireArity(opts, 1);
    result.number = math::Sign(RealOperand(opts, 0));
  } else if (cmd == "parity") {
    RequireArity(opts, 1);
    result.is_numeric = false;
    result.text = math::IsEven(IntegerOperand(opts, 0)) ? "even" : "odd";
  } else {
    throw exceptions::ConfigError("unknown command '" + cmd + "'");
  }
  return result;
}

}  // namespace terse::driver
