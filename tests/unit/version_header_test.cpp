#include "acdc/core/VersionHeader.hpp"

#include <gtest/gtest.h>
#include <string>
#include <variant>

using acdc::core::AcdcError;
using acdc::core::SerializationKind;
using acdc::core::VersionHeader;

TEST(VersionHeader, EncodesWireExampleHeader)
{
    constexpr std::uint32_t kSize{ 0xAAU };
    const VersionHeader header{ .kind = SerializationKind::Json, .totalByteSize = kSize };

    const auto encoded{ acdc::core::encodeVersionHeader(header) };
    ASSERT_TRUE(std::holds_alternative<std::string>(encoded));
    EXPECT_EQ(std::get<std::string>(encoded), "ACDC10JSON0000aa_");
    EXPECT_EQ(std::get<std::string>(encoded).size(), acdc::core::g_versionHeaderChars);
}

TEST(VersionHeader, EncodesEveryKindCode)
{
    EXPECT_EQ(acdc::core::kindCode(SerializationKind::Json), "JSON");
    EXPECT_EQ(acdc::core::kindCode(SerializationKind::Cbor), "CBOR");
    EXPECT_EQ(acdc::core::kindCode(SerializationKind::MsgPack), "MGPK");

    const VersionHeader header{ .kind = SerializationKind::MsgPack, .totalByteSize = 0x91U };
    EXPECT_EQ(std::get<std::string>(acdc::core::encodeVersionHeader(header)), "ACDC10MGPK000091_");
}

TEST(VersionHeader, DecodeRoundTripsMaximumSize)
{
    const VersionHeader header{ .kind = SerializationKind::Cbor, .totalByteSize = acdc::core::g_maxContainerBytes };
    const auto encoded{ acdc::core::encodeVersionHeader(header) };
    ASSERT_TRUE(std::holds_alternative<std::string>(encoded));
    EXPECT_EQ(std::get<std::string>(encoded), "ACDC10CBORffffff_");

    const auto decoded{ acdc::core::decodeVersionHeader(std::get<std::string>(encoded)) };
    ASSERT_TRUE(std::holds_alternative<VersionHeader>(decoded));
    EXPECT_EQ(std::get<VersionHeader>(decoded), header);
}

TEST(VersionHeader, EncodeRejectsOversizedContainer)
{
    const VersionHeader header{ .totalByteSize = acdc::core::g_maxContainerBytes + 1U };
    const auto encoded{ acdc::core::encodeVersionHeader(header) };
    ASSERT_TRUE(std::holds_alternative<AcdcError>(encoded));
    EXPECT_EQ(std::get<AcdcError>(encoded), AcdcError::HeaderSizeOverflow);
}

TEST(VersionHeader, DecodeReadsVersionDigits)
{
    const auto decoded{ acdc::core::decodeVersionHeader("ACDC21JSON00001f_") };
    ASSERT_TRUE(std::holds_alternative<VersionHeader>(decoded));
    const auto& header{ std::get<VersionHeader>(decoded) };
    EXPECT_EQ(header.majorVersion, 2U);
    EXPECT_EQ(header.minorVersion, 1U);
    EXPECT_EQ(header.kind, SerializationKind::Json);
    EXPECT_EQ(header.totalByteSize, 0x1FU);
}

TEST(VersionHeader, DecodeRejectsMalformedText)
{
    const char* const kBad[]{
        "",
        "ACDC10JSON0000aa",   // no terminator
        "ACDC10JSON0000aa__", // too long
        "KERI10JSON0000aa_",  // wrong protocol
        "ACDC10XXXX0000aa_",  // unknown kind
        "ACDC10JSON0000AA_",  // upper-case size
        "ACDC10JSON00g0aa_",  // non-hex size
        "ACDCx0JSON0000aa_",  // non-hex version
        "ACDC10JSON0000aa-",  // wrong terminator
    };
    for (const char* text : kBad)
    {
        const auto decoded{ acdc::core::decodeVersionHeader(text) };
        ASSERT_TRUE(std::holds_alternative<AcdcError>(decoded)) << text;
        EXPECT_EQ(std::get<AcdcError>(decoded), AcdcError::MalformedHeader) << text;
    }
}

TEST(VersionHeader, KindFromCodeIsExact)
{
    EXPECT_EQ(acdc::core::kindFromCode("CBOR"), SerializationKind::Cbor);
    EXPECT_FALSE(acdc::core::kindFromCode("json").has_value());
    EXPECT_FALSE(acdc::core::kindFromCode("JSONX").has_value());
}
