#include "acdc/crypto/Cesr.hpp"
#include "acdc/crypto/Digest.hpp"

#include "test_utils/TestUtils.hpp"
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <utility>

using acdc::crypto::DigestCode;

namespace
{

struct DigestVector final
{
    DigestCode code;
    const char* abcHex;
};

constexpr DigestVector g_kAbcVectors[]{
    { DigestCode::Blake3_256, "6437b3ac38465133ffb63b75273a8db548c558465d79db03fd359c6cd5bd9d85" },
    { DigestCode::Blake2b_256, "bddd813c634239723171ef3fee98579b94964e3bb1cb3e427262c8c068d52319" },
    { DigestCode::Blake2s_256, "508c5e8c327c14e2e1a72ba34eeb452f37458b209ed63a294d999b4c86675982" },
    { DigestCode::Sha3_256, "3a985da74fe225b2045c172d6bd390bd855f086e3e9d525b46bfe24511431532" },
    { DigestCode::Sha2_256, "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad" },
};

} // namespace

TEST(Digest, KnownAnswerForEveryAlgorithm)
{
    const auto abc{ acdc::test_utils::bytesOf("abc") };
    for (const auto& vector : g_kAbcVectors)
    {
        const auto digest{ acdc::crypto::computeDigest(vector.code, abc) };
        EXPECT_EQ(acdc::test_utils::toHex(digest), vector.abcHex) << acdc::crypto::digestAlgorithmName(vector.code);
    }
}

TEST(Digest, UnknownCodeThrows)
{
    const auto abc{ acdc::test_utils::bytesOf("abc") };
    EXPECT_THROW((void)acdc::crypto::computeDigest(static_cast<DigestCode>('Z'), abc), std::invalid_argument);
}

TEST(Digest, CodeCharactersRoundTrip)
{
    for (const auto& vector : g_kAbcVectors)
    {
        EXPECT_EQ(acdc::crypto::digestCodeFromChar(acdc::crypto::digestCodeChar(vector.code)), vector.code);
    }
    EXPECT_FALSE(acdc::crypto::digestCodeFromChar('A').has_value());
    EXPECT_FALSE(acdc::crypto::digestCodeFromChar('e').has_value());
}

TEST(Cesr, EncodeSaidPrefixesCodeAndKeepsLength)
{
    const auto abc{ acdc::test_utils::bytesOf("abc") };
    for (const auto& vector : g_kAbcVectors)
    {
        const std::string said{ acdc::crypto::encodeSaid(vector.code, acdc::crypto::computeDigest(vector.code, abc)) };
        EXPECT_EQ(said.size(), acdc::crypto::saidLength(vector.code));
        EXPECT_EQ(said.front(), acdc::crypto::digestCodeChar(vector.code));
        EXPECT_TRUE(acdc::crypto::isWellFormedSaid(said)) << said;
        EXPECT_EQ(acdc::crypto::saidCode(said), vector.code);
    }
}

TEST(Cesr, ZeroDigestEncoding)
{
    const acdc::crypto::Digest256 zero{};
    EXPECT_EQ(acdc::crypto::encodeSaid(DigestCode::Blake3_256, zero), "E" + std::string(43U, 'A'));
}

TEST(Cesr, RejectsMalformedSaids)
{
    EXPECT_FALSE(acdc::crypto::isWellFormedSaid(""));
    EXPECT_FALSE(acdc::crypto::isWellFormedSaid("EHaPRLWlw9RkQxgn9BGWzgJwsQy0HtOksqAstXbxo_N"));
    EXPECT_FALSE(acdc::crypto::isWellFormedSaid("ZHaPRLWlw9RkQxgn9BGWzgJwsQy0HtOksqAstXbxo_NB"));
    EXPECT_FALSE(acdc::crypto::isWellFormedSaid("EHaPRLWlw9RkQxgn9BGWzgJwsQy0HtOksqAstXbxo+NB"));
    EXPECT_TRUE(acdc::crypto::isWellFormedSaid("EHaPRLWlw9RkQxgn9BGWzgJwsQy0HtOksqAstXbxo_NB"));
}

TEST(Cesr, PlaceholderMatchesSaidLength)
{
    const std::string placeholder{ acdc::crypto::placeholderFor(DigestCode::Sha2_256) };
    EXPECT_EQ(placeholder, std::string(acdc::crypto::g_saidChars, '#'));
}

TEST(Cesr, SaltEncoding)
{
    acdc::crypto::Salt128 salt{};
    EXPECT_EQ(acdc::crypto::encodeSalt(salt), "0AAAAAAAAAAAAAAAAAAAAAAA");

    salt.fill(0xFFU);
    const std::string encoded{ acdc::crypto::encodeSalt(salt) };
    EXPECT_EQ(encoded, "0AD_____________________");
    EXPECT_EQ(encoded.size(), acdc::crypto::g_saltChars);
}
