#include "ignyx/string-trim.hpp"

#include <gtest/gtest.h>

#include "ignyx/string-equal-ignore-case.hpp"

namespace ignyx {

TEST(StringTrim, TrimBothSides) {
  EXPECT_EQ(Trim("  hello \t\r\n"), "hello");
  EXPECT_EQ(TrimLeft("  a b "), "a b ");
  EXPECT_EQ(TrimRight("  a b "), "  a b");
}

TEST(StringTrim, AllWhitespace) {
  EXPECT_TRUE(Trim(" \t ").empty());
  EXPECT_TRUE(Trim("").empty());
}

TEST(StringTrim, OwsOnlyTrimsSpaceAndTab) { EXPECT_EQ(Trim("\t value\r", kOws), "value\r"); }

TEST(StringTrim, ConstexprUsable) {
  static_assert(Trim("  x  ") == "x");
  static_assert(CaseInsensitiveEqual("Content-Length", "content-LENGTH"));
  static_assert(!CaseInsensitiveEqual("abc", "abcd"));
  static_assert(StartsWithCaseInsensitive("Upgrade, keep-alive", "upgrade"));
}

}  // namespace ignyx
