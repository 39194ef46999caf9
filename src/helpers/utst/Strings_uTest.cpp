/**
 * @file Strings_uTest.cpp
 * @brief Unit tests for modscout::helpers::strings.
 */

#include "src/helpers/inc/Strings.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <vector>

using modscout::helpers::strings::endsWith;
using modscout::helpers::strings::isAlnum;
using modscout::helpers::strings::isAlpha;
using modscout::helpers::strings::isDigit;
using modscout::helpers::strings::parseUnsigned;
using modscout::helpers::strings::spanWhile;
using modscout::helpers::strings::splitNonEmpty;
using modscout::helpers::strings::startsWith;

/** @test Character classes are ASCII-only. */
TEST(StringsTest, CharacterClasses) {
  EXPECT_TRUE(isAlpha('a'));
  EXPECT_TRUE(isAlpha('Z'));
  EXPECT_FALSE(isAlpha('_'));
  EXPECT_TRUE(isDigit('7'));
  EXPECT_FALSE(isDigit('x'));
  EXPECT_TRUE(isAlnum('q'));
  EXPECT_FALSE(isAlnum(static_cast<char>(0xE9)));
}

/** @test Leading run length. */
TEST(StringsTest, SpanWhile) {
  EXPECT_EQ(spanWhile("123abc", isDigit), 3U);
  EXPECT_EQ(spanWhile("abc", isDigit), 0U);
  EXPECT_EQ(spanWhile("", isDigit), 0U);
}

/** @test Unsigned parsing rejects junk, signs and overflow. */
TEST(StringsTest, ParseUnsigned) {
  std::uint32_t v32 = 7;
  EXPECT_TRUE(parseUnsigned("4294967295", v32));
  EXPECT_EQ(v32, 4294967295U);
  EXPECT_FALSE(parseUnsigned("4294967296", v32));
  EXPECT_EQ(v32, 4294967295U);
  EXPECT_FALSE(parseUnsigned("", v32));
  EXPECT_FALSE(parseUnsigned("-1", v32));
  EXPECT_FALSE(parseUnsigned("12x", v32));
  EXPECT_FALSE(parseUnsigned(" 1", v32));

  std::uint64_t v64 = 0;
  EXPECT_TRUE(parseUnsigned("18446744073709551615", v64));
  EXPECT_EQ(v64, UINT64_MAX);
}

/** @test Prefix and suffix checks. */
TEST(StringsTest, Affixes) {
  EXPECT_TRUE(startsWith("wireguard.ko", "wire"));
  EXPECT_FALSE(startsWith("ko", "kob"));
  EXPECT_TRUE(endsWith("wireguard.ko", ".ko"));
  EXPECT_FALSE(endsWith(".k", ".ko"));
}

/** @test Empty segments are dropped. */
TEST(StringsTest, SplitNonEmpty) {
  EXPECT_EQ(splitNonEmpty("a,b,", ','), (std::vector<std::string>{"a", "b"}));
  EXPECT_EQ(splitNonEmpty(",,a,,b", ','), (std::vector<std::string>{"a", "b"}));
  EXPECT_TRUE(splitNonEmpty(",,", ',').empty());
  EXPECT_TRUE(splitNonEmpty("", ',').empty());
}
