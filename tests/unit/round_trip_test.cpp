#include "phc/core/Parser.hpp"
#include <gtest/gtest.h>
#include <string>
#include <variant>

namespace
{

class RoundTrip : public ::testing::TestWithParam<std::string>
{
};

const std::string g_kId{ "$abc-123" };
const std::string g_kOneParam{ "$i=10000" };
const std::string g_kTwoParams{ "$i=10000,mem=heap" };
const std::string g_kSalt{ "$abcdefg" };
const std::string g_kSaltAndHash{ "$abcdefg$aGVsbG8" };

} // namespace

TEST_P(RoundTrip, SerializeOfParseIsIdentity)
{
    const std::string& text{ GetParam() };
    const auto result{ phc::core::parsePhc(text) };
    ASSERT_TRUE(std::holds_alternative<phc::core::RawPhc>(result)) << text;
    EXPECT_EQ(std::get<phc::core::RawPhc>(result).toString(), text);
}

INSTANTIATE_TEST_SUITE_P(ParamsBySaltAndHash, RoundTrip,
                         ::testing::Values(g_kId, g_kId + g_kSalt, g_kId + g_kSaltAndHash, g_kId + g_kOneParam,
                                           g_kId + g_kOneParam + g_kSalt, g_kId + g_kOneParam + g_kSaltAndHash,
                                           g_kId + g_kTwoParams, g_kId + g_kTwoParams + g_kSalt,
                                           g_kId + g_kTwoParams + g_kSaltAndHash));

INSTANTIATE_TEST_SUITE_P(Realistic, RoundTrip,
                         ::testing::Values("$argon2id$m=65536,t=3,p=4$c29tZXNhbHQ$RdescudvJCsgt3ub+b+dWRWJTmaaJObG",
                                           "$pbkdf2-sha256$i=100000$Salt.With-Dots$aGFzaA",
                                           "$scrypt$ln=15,r=8,p=1$c2FsdA$+/+/", "$x$a=-1,b=1.5$s"));

TEST(RoundTripBoundary, EmptyParamListEmitsNoSegment)
{
    const phc::core::RawPhc raw{ "abc-123", {} };
    EXPECT_EQ(raw.toString(), "$abc-123");
}
