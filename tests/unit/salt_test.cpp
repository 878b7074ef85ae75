#include "phc/core/Salt.hpp"
#include "test_utils/TestUtils.hpp"
#include <array>
#include <gtest/gtest.h>
#include <stdexcept>

using phc::core::Salt;
using phc::test_utils::bytesOf;

TEST(Salt, AsciiSaltSerializesVerbatim)
{
    EXPECT_EQ(Salt::fromAscii("abcdefg").toString(), "abcdefg");
}

TEST(Salt, BinarySaltSerializesToBase64)
{
    EXPECT_EQ(Salt::fromBinary(bytesOf("some salt")).toString(), "c29tZSBzYWx0");
}

TEST(Salt, BinaryFromFixedArray)
{
    constexpr std::array<std::uint8_t, 5> kHello{ 'h', 'e', 'l', 'l', 'o' };
    const Salt salt{ Salt::fromBinary(std::span<const std::uint8_t>{ kHello }) };
    EXPECT_TRUE(salt.isBinary());
    EXPECT_EQ(salt, Salt::fromBinary(bytesOf("hello")));
}

TEST(Salt, ConstructionPathDecidesTheAlternative)
{
    const Salt ascii{ Salt::fromAscii("c29tZSBzYWx0") };
    EXPECT_TRUE(ascii.isAscii());
    EXPECT_FALSE(ascii.isBinary());
    ASSERT_TRUE(ascii.ascii().has_value());
    EXPECT_EQ(*ascii.ascii(), "c29tZSBzYWx0");
    EXPECT_FALSE(ascii.binary().has_value());

    const Salt binary{ Salt::fromBinary(bytesOf("c29tZSBzYWx0")) };
    EXPECT_TRUE(binary.isBinary());
    EXPECT_FALSE(binary.ascii().has_value());
    EXPECT_NE(ascii, binary);
}

TEST(Salt, RejectsCharactersOutsideValueCharset)
{
    EXPECT_THROW((void)Salt::fromAscii("Not salt!"), std::invalid_argument);
    EXPECT_THROW((void)Salt::fromAscii("a$b"), std::invalid_argument);
    EXPECT_THROW((void)Salt::fromAscii(""), std::invalid_argument);
}

TEST(Salt, Base64AsciiSaltConvertsToBinary)
{
    EXPECT_EQ(Salt::fromAscii("c29tZSBzYWx0").asBinary(), Salt::fromBinary(bytesOf("some salt")));
}

TEST(Salt, BinarySaltAsBinaryIsSame)
{
    const Salt salt{ Salt::fromBinary(bytesOf("some salt")) };
    EXPECT_EQ(salt.asBinary(), salt);
}

TEST(Salt, NonBase64AsciiSaltDoesNotConvert)
{
    // '.' and '-' are legal salt characters but not base64.
    const Salt dotted{ Salt::fromAscii("not.base64-") };
    EXPECT_EQ(dotted.asBinary(), dotted);

    const Salt badLength{ Salt::fromAscii("abcde") };
    EXPECT_EQ(badLength.asBinary(), badLength);
    EXPECT_TRUE(badLength.asBinary().isAscii());
}
