/***
 * Name: test_run
 * Purpose: End-to-end terse-calc runs against in-memory streams.
 * Theory of Operation: Results with inexact pow rounding are checked through
 *   --precision rather than the shortest form.
 */
#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "terse/driver/app.h"
#include "terse/exceptions/config_error.h"

using namespace terse::driver;

namespace {

struct Outcome {
  int status;
  std::string out;
  std::string err;
};

template <std::size_t N>
Outcome RunWith(const char* (&argv)[N]) {
  std::ostringstream out;
  std::ostringstream err;
  const int status = Run(static_cast<int>(N), argv, out, err);
  return Outcome{status, out.str(), err.str()};
}

}  // namespace

TEST(Run, SquareRootText) {
  const char* argv[] = {"terse-calc", "sqrt", "16"};
  const Outcome r = RunWith(argv);
  EXPECT_EQ(r.status, kExitOk);
  EXPECT_EQ(r.out, "4.0\n");
  EXPECT_TRUE(r.err.empty());
}

TEST(Run, OddRootOfNegative) {
  const char* argv[] = {"terse-calc", "--precision=3", "root", "-243", "5"};
  const Outcome r = RunWith(argv);
  EXPECT_EQ(r.status, kExitOk);
  EXPECT_EQ(r.out, "-3.000\n");
}

TEST(Run, EvenRootOfNegativeIsNaN) {
  const char* argv[] = {"terse-calc", "root", "-64", "2"};
  const Outcome r = RunWith(argv);
  EXPECT_EQ(r.status, kExitNaN);
  EXPECT_EQ(r.out, "nan\n");
}

TEST(Run, PowerAndSign) {
  const char* pow_argv[] = {"terse-calc", "pow", "2", "10"};
  EXPECT_EQ(RunWith(pow_argv).out, "1024.0\n");
  const char* sign_argv[] = {"terse-calc", "sign", "-5"};
  EXPECT_EQ(RunWith(sign_argv).out, "-1.0\n");
}

TEST(Run, ParityJson) {
  const char* argv[] = {"terse-calc", "--format=json", "parity", "-3"};
  const Outcome r = RunWith(argv);
  EXPECT_EQ(r.status, kExitOk);
  EXPECT_EQ(r.out, "{\"command\": \"parity\", \"operands\": [\"-3\"], \"result\": \"odd\"}\n");
}

TEST(Run, NumericJson) {
  const char* argv[] = {"terse-calc", "--format=json", "fourth-root", "81"};
  EXPECT_EQ(RunWith(argv).out, "{\"command\": \"fourth-root\", \"operands\": [\"81\"], \"result\": 3.0}\n");
  const char* nan_argv[] = {"terse-calc", "--format=json", "sqrt", "-1"};
  const Outcome r = RunWith(nan_argv);
  EXPECT_EQ(r.status, kExitNaN);
  EXPECT_EQ(r.out, "{\"command\": \"sqrt\", \"operands\": [\"-1\"], \"result\": \"nan\"}\n");
}

TEST(Run, JsonEscapesWhitespacePaddedOperands) {
  const char* argv[] = {"terse-calc", "--format=json", "sqrt", "4\n"};
  const Outcome r = RunWith(argv);
  EXPECT_EQ(r.status, kExitOk);
  EXPECT_EQ(r.out, "{\"command\": \"sqrt\", \"operands\": [\"4\\n\"], \"result\": 2.0}\n");

  const char* padded[] = {"terse-calc", "--format=json", "pow", "\t2\r", "10\v"};
  EXPECT_EQ(RunWith(padded).out,
            "{\"command\": \"pow\", \"operands\": [\"\\t2\\r\", \"10\\u000B\"], \"result\": 1024.0}\n");
}

TEST(Run, Help) {
  const char* argv[] = {"/usr/bin/terse-calc", "-h"};
  const Outcome r = RunWith(argv);
  EXPECT_EQ(r.status, kExitOk);
  EXPECT_EQ(r.out.rfind("Usage: terse-calc [options]", 0), 0u);
}

TEST(Run, UsageOnParseError) {
  const char* argv[] = {"terse-calc", "--nope"};
  const Outcome r = RunWith(argv);
  EXPECT_EQ(r.status, kExitError);
  EXPECT_TRUE(r.out.empty());
  EXPECT_NE(r.err.find("Usage:"), std::string::npos);
}

TEST(Run, CommandErrors) {
  const char* unknown[] = {"terse-calc", "frobnicate", "1"};
  Outcome r = RunWith(unknown);
  EXPECT_EQ(r.status, kExitError);
  EXPECT_EQ(r.err, "terse-calc: error: unknown command 'frobnicate'\n");

  const char* arity[] = {"terse-calc", "root", "8"};
  r = RunWith(arity);
  EXPECT_EQ(r.status, kExitError);
  EXPECT_EQ(r.err, "terse-calc: error: 'root' expects 2 operands, got 1\n");

  const char* bad[] = {"terse-calc", "parity", "2.5"};
  r = RunWith(bad);
  EXPECT_EQ(r.status, kExitError);
  EXPECT_EQ(r.err, "terse-calc: error: bad operand '2.5' for 'parity': invalid character in integer literal\n");
}

TEST(Run, VerboseTraces) {
  const char* argv[] = {"terse-calc", "-v", "cbrt", "-27"};
  const Outcome r = RunWith(argv);
  EXPECT_EQ(r.status, kExitOk);
  EXPECT_NE(r.err.find("terse-calc: trace: command 'cbrt' operands [\"-27\"]"), std::string::npos);
}

TEST(RunCommand, ThrowsConfigError) {
  CliOptions opts;
  opts.command = "sqrt";
  opts.operands = {"4", "5"};
  EXPECT_THROW(RunCommand(opts), terse::exceptions::ConfigError);
}
