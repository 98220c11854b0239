/***
 * Name: test_parseargs_sad
 * Purpose: Ensure invalid options and values are rejected.
 */
#include <gtest/gtest.h>
#include "cli/ParseArgs.h"
#include "cli/ParseArgsInternals.h"

using namespace pyrite::cli;

TEST(CLI_Sad, UnknownOption) {
  const char* argv[] = {"pyrite-astdump", "--frobnicate", "m.py"};
  Options o;
  EXPECT_FALSE(ParseArgs(3, const_cast<char**>(argv), o));
}

TEST(CLI_Sad, BadTabWidth) {
  const char* argv1[] = {"pyrite-astdump", "--tab-width=0", "m.py"};
  Options o1;
  EXPECT_FALSE(ParseArgs(3, const_cast<char**>(argv1), o1));
  EXPECT_EQ(o1.error, "invalid --tab-width value '0'");
  EXPECT_EQ(o1.tabWidth, 8);

  const char* argv2[] = {"pyrite-astdump", "--tab-width=4x", "m.py"};
  Options o2;
  EXPECT_FALSE(ParseArgs(3, const_cast<char**>(argv2), o2));
}

TEST(CLI_Sad, BadMaxDepth) {
  const char* argv[] = {"pyrite-astdump", "--max-depth=", "m.py"};
  Options o;
  EXPECT_FALSE(ParseArgs(3, const_cast<char**>(argv), o));
  EXPECT_EQ(o.error, "invalid --max-depth value ''");
  EXPECT_EQ(o.maxDepth, 1000);
}

TEST(CLI_Sad, ParseIntValueBounds) {
  int value = 7;
  EXPECT_FALSE(detail::parseIntValue("-1", 1, 10, value));
  EXPECT_FALSE(detail::parseIntValue("11", 1, 10, value));
  EXPECT_FALSE(detail::parseIntValue("99999999999999999999", 1, 10, value));
  EXPECT_FALSE(detail::parseIntValue(" 3", 1, 10, value));
  EXPECT_EQ(value, 7);
  EXPECT_TRUE(detail::parseIntValue("10", 1, 10, value));
  EXPECT_EQ(value, 10);
}
