#include "manager/comparator.hpp"

#include "gtest/gtest.h"

namespace {

using manager::CompareOutputs;
using manager::StripTrailingNewline;

// NOLINTNEXTLINE
TEST(Comparator, StripTrailingNewline) {
  EXPECT_EQ(StripTrailingNewline("10\n"), "10");
  EXPECT_EQ(StripTrailingNewline("10\r\n"), "10");
  EXPECT_EQ(StripTrailingNewline("10\n\n"), "10\n");
  EXPECT_EQ(StripTrailingNewline("10\r"), "10\r");
  EXPECT_EQ(StripTrailingNewline("10 "), "10 ");
  EXPECT_EQ(StripTrailingNewline("\n"), "");
  EXPECT_EQ(StripTrailingNewline(""), "");
}

// NOLINTNEXTLINE
TEST(Comparator, SingleTrailingNewlineIsIgnored) {
  EXPECT_TRUE(CompareOutputs("10\n", "10"));
  EXPECT_TRUE(CompareOutputs("10", "10\n"));
  EXPECT_TRUE(CompareOutputs("10\r\n", "10"));
  EXPECT_TRUE(CompareOutputs("", ""));
  EXPECT_TRUE(CompareOutputs("\n", ""));
  EXPECT_TRUE(CompareOutputs("1\n2\n", "1\n2"));
}

// NOLINTNEXTLINE
TEST(Comparator, OtherWhitespaceIsSignificant) {
  EXPECT_FALSE(CompareOutputs("10 \n", "10"));
  EXPECT_FALSE(CompareOutputs("10\n\n", "10"));
  EXPECT_FALSE(CompareOutputs("1  2", "1 2"));
  EXPECT_FALSE(CompareOutputs(" 10", "10"));
  EXPECT_FALSE(CompareOutputs("10\t", "10"));
  EXPECT_FALSE(CompareOutputs("10", "11"));
}

}  // namespace
