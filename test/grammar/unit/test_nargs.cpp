/***
 * Name: test_nargs
 * Purpose: Arity parsing, fullness and textual form.
 */
#include <gtest/gtest.h>
#include "grammar/NArgs.h"

using namespace cmfmt::grammar;

TEST(NArgs, ParseSymbolsAndCounts) {
  EXPECT_EQ(NArgs::parse("*"), NArgs::ZeroOrMore());
  EXPECT_EQ(NArgs::parse("+"), NArgs::OneOrMore());
  EXPECT_EQ(NArgs::parse("?"), NArgs::ZeroOrOne());
  EXPECT_EQ(NArgs::parse("3"), NArgs::Exactly(3));
  EXPECT_EQ(NArgs::parse("0"), NArgs::Exactly(0));
  EXPECT_FALSE(NArgs::parse("-1").has_value());
  EXPECT_FALSE(NArgs::parse("x").has_value());
  EXPECT_FALSE(NArgs::parse("").has_value());
}

TEST(NArgs, IsFull) {
  EXPECT_FALSE(NArgs::Exactly(2).isFull(1));
  EXPECT_TRUE(NArgs::Exactly(2).isFull(2));
  EXPECT_TRUE(NArgs::Exactly(0).isFull(0));
  EXPECT_FALSE(NArgs::ZeroOrOne().isFull(0));
  EXPECT_TRUE(NArgs::ZeroOrOne().isFull(1));
  EXPECT_FALSE(NArgs::ZeroOrMore().isFull(100));
  EXPECT_FALSE(NArgs::OneOrMore().isFull(100));
}

TEST(NArgs, Str) {
  EXPECT_EQ(NArgs::Exactly(4).str(), "4");
  EXPECT_EQ(NArgs::ZeroOrOne().str(), "?");
  EXPECT_EQ(NArgs::ZeroOrMore().str(), "*");
  EXPECT_EQ(NArgs::OneOrMore().str(), "+");
  EXPECT_TRUE(NArgs::Exactly(1).isExact());
  EXPECT_FALSE(NArgs::OneOrMore().isExact());
}
