/***
 * Name: terse::tests::TypeName
 * Purpose: Validate demangled type names and PrintType output.
 */
#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

#include "terse/strings/type_name.h"

using namespace terse::strings;

TEST(TypeName, Builtins) {
  EXPECT_EQ("int", TypeName<int>());
  EXPECT_EQ("double", TypeNameOf(2.5));
}

TEST(TypeName, Templates) {
  EXPECT_NE(std::string::npos, TypeName<std::vector<int>>().find("std::vector<int"));
}

TEST(TypeName, PrintType) {
  std::ostringstream out;
  PrintType(3.5f, out);
  EXPECT_EQ("float\n", out.str());
}

TEST(TypeName, DemangleFallsBackToInput) {
  EXPECT_EQ("not a mangled name", Demangle("not a mangled name"));
  EXPECT_EQ("", Demangle(nullptr));
}
