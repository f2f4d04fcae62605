/***
 * Name: test_usage
 * Purpose: Validate Usage() content exposes documented flags.
 */
#include <gtest/gtest.h>
#include "cli/Usage.h"

using namespace cmfmt::cli;

TEST(CLI_Usage, ContainsExpectedFlags) {
  auto u = Usage();
  EXPECT_EQ(u.rfind("cmfmt [options] file", 0), 0u);
  EXPECT_NE(u.find("-o <file>"), std::string::npos);
  EXPECT_NE(u.find("--config-file=<file>"), std::string::npos);
  EXPECT_NE(u.find("--dump=<mode>"), std::string::npos);
  EXPECT_NE(u.find("roundtrip|tokens|tree"), std::string::npos);
  EXPECT_NE(u.find("--check"), std::string::npos);
  EXPECT_NE(u.find("--lint"), std::string::npos);
  EXPECT_NE(u.find("--dump-config"), std::string::npos);
  EXPECT_NE(u.find("--metrics-json"), std::string::npos);
  EXPECT_NE(u.find("--log-tree"), std::string::npos);
  EXPECT_NE(u.find("--color="), std::string::npos);
  EXPECT_NE(u.find("--diag-context="), std::string::npos);
  EXPECT_NE(u.find("--                      End of options"), std::string::npos);
}
