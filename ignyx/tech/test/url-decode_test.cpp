#include "ignyx/url-decode.hpp"

#include <gtest/gtest.h>

#include <optional>
#include <string>

namespace ignyx::url {

TEST(UrlDecode, PlainStringIsUnchanged) { EXPECT_EQ(Decode("/users/42"), std::optional<std::string>("/users/42")); }

TEST(UrlDecode, PercentEscapes) {
  EXPECT_EQ(Decode("a%20b%2Fc"), std::optional<std::string>("a b/c"));
  EXPECT_EQ(Decode("%e2%82%AC"), std::optional<std::string>("\xE2\x82\xAC"));
}

TEST(UrlDecode, PlusPolicy) {
  EXPECT_EQ(Decode("a+b"), std::optional<std::string>("a+b"));
  EXPECT_EQ(Decode("a+b", PlusPolicy::AsSpace), std::optional<std::string>("a b"));
}

TEST(UrlDecode, MalformedEscapesAreRejected) {
  EXPECT_FALSE(Decode("%"));
  EXPECT_FALSE(Decode("abc%4"));
  EXPECT_FALSE(Decode("%zz"));
}

TEST(UrlDecode, LenientKeepsMalformedEscapes) {
  EXPECT_EQ(DecodeLenient("100%"), "100%");
  EXPECT_EQ(DecodeLenient("%zz%41"), "%zzA");
}

TEST(UrlDecode, ParseQueryString) {
  const auto pairs = ParseQueryString("a=1&&b=x+y&flag&c=%3D");
  ASSERT_EQ(pairs.size(), 4U);
  EXPECT_EQ(pairs[0].first, "a");
  EXPECT_EQ(pairs[0].second, "1");
  EXPECT_EQ(pairs[1].first, "b");
  EXPECT_EQ(pairs[1].second, "x y");
  EXPECT_EQ(pairs[2].first, "flag");
  EXPECT_TRUE(pairs[2].second.empty());
  EXPECT_EQ(pairs[3].second, "=");
}

TEST(UrlDecode, ParseQueryStringKeepsRepeatedKeysInOrder) {
  const auto pairs = ParseQueryString("tag=a&tag=b&tag=c");
  ASSERT_EQ(pairs.size(), 3U);
  EXPECT_EQ(pairs[0].second, "a");
  EXPECT_EQ(pairs[2].second, "c");
}

}  // namespace ignyx::url
