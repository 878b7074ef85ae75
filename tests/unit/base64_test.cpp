#include "phc/encoding/Base64.hpp"
#include "test_utils/TestUtils.hpp"
#include <array>
#include <cstdint>
#include <gtest/gtest.h>

using phc::encoding::decodeBase64NoPad;
using phc::encoding::encodeBase64NoPad;
using phc::test_utils::bytesOf;
using phc::test_utils::textOf;

TEST(Base64, EncodesWithoutPadding)
{
    EXPECT_EQ(encodeBase64NoPad(bytesOf("hello")), "aGVsbG8");
    EXPECT_EQ(encodeBase64NoPad(bytesOf("some salt")), "c29tZSBzYWx0");
    EXPECT_EQ(encodeBase64NoPad(bytesOf("ab")), "YWI");
    EXPECT_EQ(encodeBase64NoPad(bytesOf("a")), "YQ");
}

TEST(Base64, EncodesEmptyInputAsEmptyString)
{
    EXPECT_EQ(encodeBase64NoPad(std::span<const std::uint8_t>{}), "");
}

TEST(Base64, UsesStandardAlphabet)
{
    constexpr std::array<std::uint8_t, 3> kHighBits{ 0xFBU, 0xFFU, 0xBFU };
    EXPECT_EQ(encodeBase64NoPad(kHighBits), "+/+/");
}

TEST(Base64, DecodesUnpaddedText)
{
    const auto hello{ decodeBase64NoPad("aGVsbG8") };
    ASSERT_TRUE(hello.has_value());
    EXPECT_EQ(textOf(*hello), "hello");

    const auto salt{ decodeBase64NoPad("c29tZSBzYWx0") };
    ASSERT_TRUE(salt.has_value());
    EXPECT_EQ(textOf(*salt), "some salt");
}

TEST(Base64, DecodesEmptyText)
{
    const auto empty{ decodeBase64NoPad("") };
    ASSERT_TRUE(empty.has_value());
    EXPECT_TRUE(empty->empty());
}

TEST(Base64, RejectsPadding)
{
    EXPECT_FALSE(decodeBase64NoPad("aGVsbG8=").has_value());
    EXPECT_FALSE(decodeBase64NoPad("YQ==").has_value());
}

TEST(Base64, RejectsCharactersOutsideAlphabet)
{
    EXPECT_FALSE(decodeBase64NoPad("abc-").has_value());
    EXPECT_FALSE(decodeBase64NoPad("ab.c").has_value());
    EXPECT_FALSE(decodeBase64NoPad("ab c").has_value());
    EXPECT_FALSE(decodeBase64NoPad("Not salt!").has_value());
}

TEST(Base64, RejectsImpossibleLength)
{
    EXPECT_FALSE(decodeBase64NoPad("a").has_value());
    EXPECT_FALSE(decodeBase64NoPad("abcde").has_value());
}

TEST(Base64, RejectsNonZeroTrailingBits)
{
    // "YQ" is canonical for "a"; "YR" carries stray low bits that would not re-encode identically.
    EXPECT_TRUE(decodeBase64NoPad("YQ").has_value());
    EXPECT_FALSE(decodeBase64NoPad("YR").has_value());
}

TEST(Base64, DecodesStandardAlphabetHighBits)
{
    const auto bytes{ decodeBase64NoPad("+/+/") };
    ASSERT_TRUE(bytes.has_value());
    EXPECT_EQ(phc::test_utils::toHex(*bytes), "fbffbf");
}
