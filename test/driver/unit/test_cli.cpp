/***
 * Name: test_cli
 * Purpose: terse-calc option parsing and negative cases.
 */
#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "terse/driver/cli.h"
#include "terse/driver/cli_parse.h"

using namespace terse::driver;

TEST(CLI, CommandAndOperands) {
  const char* argv[] = {"terse-calc", "root", "243", "5"};
  CliOptions o;
  std::ostringstream err;
  ASSERT_TRUE(ParseCli(4, argv, o, err));
  EXPECT_EQ(o.command, "root");
  ASSERT_EQ(o.operands.size(), 2u);
  EXPECT_EQ(o.operands[0], "243");
  EXPECT_EQ(o.operands[1], "5");
  EXPECT_FALSE(o.verbose);
  EXPECT_EQ(o.format, CliOptions::OutputFormat::Text);
  EXPECT_FALSE(o.precision.has_value());
  EXPECT_TRUE(err.str().empty());
}

TEST(CLI, OptionsAnywhere) {
  const char* argv[] = {"terse-calc", "-v", "pow", "--format=json", "2", "--precision=3", "8"};
  CliOptions o;
  std::ostringstream err;
  ASSERT_TRUE(ParseCli(7, argv, o, err));
  EXPECT_TRUE(o.verbose);
  EXPECT_EQ(o.format, CliOptions::OutputFormat::Json);
  ASSERT_TRUE(o.precision.has_value());
  EXPECT_EQ(*o.precision, 3);
  EXPECT_EQ(o.command, "pow");
  ASSERT_EQ(o.operands.size(), 2u);
  EXPECT_EQ(o.operands[1], "8");
}

TEST(CLI, NegativeNumbersArePositional) {
  const char* argv[] = {"terse-calc", "root", "-243", "5", "-.5", "-inf"};
  CliOptions o;
  std::ostringstream err;
  ASSERT_TRUE(ParseCli(6, argv, o, err));
  ASSERT_EQ(o.operands.size(), 4u);
  EXPECT_EQ(o.operands[0], "-243");
  EXPECT_EQ(o.operands[2], "-.5");
  EXPECT_EQ(o.operands[3], "-inf");
}

TEST(CLI, EndOfOptions) {
  const char* argv[] = {"terse-calc", "--", "sign", "--verbose"};
  CliOptions o;
  std::ostringstream err;
  ASSERT_TRUE(ParseCli(4, argv, o, err));
  EXPECT_FALSE(o.verbose);
  EXPECT_EQ(o.command, "sign");
  ASSERT_EQ(o.operands.size(), 1u);
  EXPECT_EQ(o.operands[0], "--verbose");
}

TEST(CLI, HelpStopsParsing) {
  const char* argv[] = {"terse-calc", "--help", "--bogus"};
  CliOptions o;
  std::ostringstream err;
  ASSERT_TRUE(ParseCli(3, argv, o, err));
  EXPECT_TRUE(o.show_help);
}

TEST(CLI, UnknownOption) {
  const char* argv[] = {"terse-calc", "--unknown", "sqrt", "4"};
  CliOptions o;
  std::ostringstream err;
  EXPECT_FALSE(ParseCli(4, argv, o, err));
  EXPECT_NE(err.str().find("unknown option '--unknown'"), std::string::npos);
}

TEST(CLI, MissingCommand) {
  const char* argv[] = {"terse-calc", "-v"};
  CliOptions o;
  std::ostringstream err;
  EXPECT_FALSE(ParseCli(2, argv, o, err));
  EXPECT_NE(err.str().find("no command given"), std::string::npos);
}

TEST(CLI, BadFormat) {
  const char* argv[] = {"terse-calc", "--format=xml", "sqrt", "4"};
  CliOptions o;
  std::ostringstream err;
  EXPECT_FALSE(ParseCli(4, argv, o, err));
  EXPECT_NE(err.str().find("unknown output format 'xml'"), std::string::npos);
}

TEST(CLI, BadPrecision) {
  CliOptions o;
  std::ostringstream err;
  const char* too_big[] = {"terse-calc", "--precision=18", "sqrt", "4"};
  EXPECT_FALSE(ParseCli(4, too_big, o, err));
  const char* not_a_number[] = {"terse-calc", "--precision=two", "sqrt", "4"};
  EXPECT_FALSE(ParseCli(4, not_a_number, o, err));
  EXPECT_NE(err.str().find("invalid precision 'two'"), std::string::npos);
}

TEST(CLI, NullArgvIsNoCommand) {
  CliOptions o;
  std::ostringstream err;
  EXPECT_FALSE(ParseCli(0, nullptr, o, err));
}

TEST(CLI, LooksNumeric) {
  using terse::driver::detail::LooksNumeric;
  EXPECT_TRUE(LooksNumeric("-1"));
  EXPECT_TRUE(LooksNumeric("-.25"));
  EXPECT_TRUE(LooksNumeric("-nan"));
  EXPECT_FALSE(LooksNumeric("-v"));
  EXPECT_FALSE(LooksNumeric("-"));
  EXPECT_FALSE(LooksNumeric("12"));
}
