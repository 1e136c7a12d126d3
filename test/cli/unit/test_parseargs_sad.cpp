/***
 * Name: test_parseargs_sad
 * Purpose: Validate ParseArgs rejects bad option combinations and values.
 */
#include <gtest/gtest.h>
#include "cli/ParseArgs.h"

using namespace puretop::cli;

TEST(CLI_Sad, NoInputs) {
  const char* argv[] = {"puretop"};
  Options o;
  ASSERT_FALSE(ParseArgs(1, const_cast<char**>(argv), o));
}

TEST(CLI_Sad, UnknownOption) {
  const char* argv[] = {"puretop", "--frobnicate", "x.js"};
  Options o;
  ASSERT_FALSE(ParseArgs(3, const_cast<char**>(argv), o));
}

TEST(CLI_Sad, OutputMissingValue) {
  const char* argv[] = {"puretop", "x.js", "-o"};
  Options o;
  ASSERT_FALSE(ParseArgs(3, const_cast<char**>(argv), o));
}

TEST(CLI_Sad, OutputWithInPlace) {
  const char* argv[] = {"puretop", "-o", "out.js", "--in-place", "x.js"};
  Options o;
  ASSERT_FALSE(ParseArgs(5, const_cast<char**>(argv), o));
}

TEST(CLI_Sad, MultipleInputsWithoutInPlace) {
  const char* argv[] = {"puretop", "a.js", "b.js"};
  Options o;
  ASSERT_FALSE(ParseArgs(3, const_cast<char**>(argv), o));
}

TEST(CLI_Sad, BadColorValue) {
  const char* argv[] = {"puretop", "--color=sometimes", "x.js"};
  Options o;
  ASSERT_FALSE(ParseArgs(3, const_cast<char**>(argv), o));
}

TEST(CLI_Sad, BadAstLogValue) {
  const char* argv[] = {"puretop", "--ast-log=during", "x.js"};
  Options o;
  ASSERT_FALSE(ParseArgs(3, const_cast<char**>(argv), o));
}

TEST(CLI_Sad, BadDiagContext) {
  const char* argv[] = {"puretop", "--diag-context=two", "x.js"};
  Options o;
  ASSERT_FALSE(ParseArgs(3, const_cast<char**>(argv), o));
  const char* argv2[] = {"puretop", "--diag-context=", "x.js"};
  Options o2;
  ASSERT_FALSE(ParseArgs(3, const_cast<char**>(argv2), o2));
}

TEST(CLI_Sad, EmptyDenyFile) {
  const char* argv[] = {"puretop", "--deny-file=", "x.js"};
  Options o;
  ASSERT_FALSE(ParseArgs(3, const_cast<char**>(argv), o));
}
