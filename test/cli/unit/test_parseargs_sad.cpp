/***
 * Name: test_parseargs_sad
 * Purpose: Exercise sad-path CLI parsing for invalid/missing/unknown cases.
 */
#include <gtest/gtest.h>
#include "cli/ParseArgs.h"

using namespace cmfmt::cli;

TEST(CLI_Sad, UnknownOption) {
  const char* argv[] = {"cmfmt", "--unknown"};
  Options o; EXPECT_FALSE(ParseArgs(2, const_cast<char**>(argv), o));
}

TEST(CLI_Sad, MissingOutputArgument) {
  const char* argv[] = {"cmfmt", "-o"};
  Options o; EXPECT_FALSE(ParseArgs(2, const_cast<char**>(argv), o));
}

TEST(CLI_Sad, MissingConfigArgument) {
  const char* argv[] = {"cmfmt", "a.cmake", "-c"};
  Options o; EXPECT_FALSE(ParseArgs(3, const_cast<char**>(argv), o));
}

TEST(CLI_Sad, InputStartingWithDashWithoutEndOfOptions) {
  const char* argv[] = {"cmfmt", "-strange.cmake"};
  Options o; EXPECT_FALSE(ParseArgs(2, const_cast<char**>(argv), o));
}

TEST(CLI_Sad, UnknownDumpMode) {
  const char* argv[] = {"cmfmt", "--dump=ast", "a.cmake"};
  Options o; EXPECT_FALSE(ParseArgs(3, const_cast<char**>(argv), o));
}

TEST(CLI_Sad, CheckConflictsWithDump) {
  const char* argv[] = {"cmfmt", "--check", "--dump=tree", "a.cmake"};
  Options o; EXPECT_FALSE(ParseArgs(4, const_cast<char**>(argv), o));
}

TEST(CLI_Sad, ColorInvalidFallsBackToAuto) {
  const char* argv[] = {"cmfmt", "--color=weird", "a.cmake"};
  Options o; ASSERT_TRUE(ParseArgs(3, const_cast<char**>(argv), o));
  EXPECT_EQ(o.color, ColorMode::Auto);
}

TEST(CLI_Sad, DiagContextNonNumericBecomesZero) {
  const char* argv[] = {"cmfmt", "--diag-context=abc", "a.cmake"};
  Options o; ASSERT_TRUE(ParseArgs(3, const_cast<char**>(argv), o));
  EXPECT_EQ(o.diagContext, 0);
}
