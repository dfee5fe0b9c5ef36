// test_utf8.cpp - strict UTF-8 <-> scalar value conversion.

#include <gtest/gtest.h>

#include "utf8.hpp"

#include <string>

TEST(Utf8Test, DecodesMixedWidthScalars)
{
    // a, é, €, U+1F600
    std::string text = "a\xC3\xA9\xE2\x82\xAC\xF0\x9F\x98\x80";
    std::u32string scalars;

    ASSERT_TRUE(utf8::decode(text, scalars));
    ASSERT_EQ(scalars.size(), 4u);
    EXPECT_EQ(scalars[0], U'a');
    EXPECT_EQ(scalars[1], static_cast<char32_t>(0xE9));
    EXPECT_EQ(scalars[2], static_cast<char32_t>(0x20AC));
    EXPECT_EQ(scalars[3], static_cast<char32_t>(0x1F600));

    EXPECT_EQ(utf8::encode(scalars), text);
}

TEST(Utf8Test, RejectsMalformedSequences)
{
    std::u32string scalars;

    EXPECT_FALSE(utf8::decode(std::string("\xC0\x80"), scalars));          // overlong NUL
    EXPECT_FALSE(utf8::decode(std::string("\xED\xA0\x80"), scalars));      // surrogate
    EXPECT_FALSE(utf8::decode(std::string("\xE2\x82"), scalars));          // truncated
    EXPECT_FALSE(utf8::decode(std::string("\xF4\x90\x80\x80"), scalars));  // > U+10FFFF
    EXPECT_FALSE(utf8::decode(std::string("\x80"), scalars));              // lone continuation
    EXPECT_FALSE(utf8::decode(std::string("\xFF"), scalars));
}

TEST(Utf8Test, EmptyAndNulAreValid)
{
    std::u32string scalars;
    EXPECT_TRUE(utf8::decode(std::string(), scalars));
    EXPECT_TRUE(scalars.empty());

    EXPECT_TRUE(utf8::isValid(std::vector<uint8_t>{'a', 0x00, 'b'}));
    EXPECT_FALSE(utf8::isValid(std::vector<uint8_t>{0xAB, 0xCC}));
}

TEST(Utf8Test, EncodesZeroWidthCharacters)
{
    std::u32string scalars = {0xFEFF, 0x200B, 0x200C, 0x200D};
    EXPECT_EQ(utf8::encode(scalars),
              "\xEF\xBB\xBF\xE2\x80\x8B\xE2\x80\x8C\xE2\x80\x8D");
}
