#include "acdc/core/Attestation.hpp"

#include "acdc/core/Compaction.hpp"
#include "acdc/core/Said.hpp"
#include "test_utils/ContainerFixtures.hpp"
#include "test_utils/TestUtils.hpp"
#include <gtest/gtest.h>
#include <string>
#include <variant>

using acdc::core::AcdcError;
using acdc::core::AttestationOptions;
using acdc::core::Container;
using acdc::core::Document;

namespace
{

[[nodiscard]] acdc::core::AcdcResult<Container> newHelloWorld(const AttestationOptions& options = {})
{
    return acdc::core::newContainer(std::string{ acdc::test_utils::g_kIssuer }, "",
                                    std::string{ acdc::test_utils::g_kSchema }, acdc::test_utils::helloWorld(),
                                    options);
}

} // namespace

TEST(Attestation, PublicUntargetedMatchesWireExample)
{
    const auto res{ newHelloWorld() };
    ASSERT_TRUE(std::holds_alternative<Container>(res));
    EXPECT_EQ(std::get<Container>(res).encodeToString(), acdc::test_utils::g_kHelloWorldJson);
    EXPECT_TRUE(acdc::core::verify(std::get<Container>(res)));
}

TEST(Attestation, PrivateWithFixedSaltIsReproducible)
{
    AttestationOptions options{};
    options.privateAttributes = true;
    options.salt = acdc::crypto::Salt128{};

    const auto res{ newHelloWorld(options) };
    ASSERT_TRUE(std::holds_alternative<Container>(res));
    const auto& container{ std::get<Container>(res) };
    EXPECT_EQ(container.encodeToString(),
              R"({"v":"ACDC10JSON0000fc_","d":"EGekksUXh_x_WyBDKVdK_H2NgdfGAvPvLPmt7R9ceKm4","i":"Issuer","ri":"",)"
              R"("s":"EFNWOR0fQbv_J6EL0pJlvCxEpbu4bg1AurHgr_0A7LKc","a":{"d":"EFpSljDDUI1F9P6sfaxDze65PeTcPd_s0-IFT-yZZM8T",)"
              R"("u":"0AAAAAAAAAAAAAAAAAAAAAAA","hello":"world"}})");
}

TEST(Attestation, PrivateBlockCompactsToItsOwnSaid)
{
    AttestationOptions options{};
    options.privateAttributes = true;

    const auto res{ newHelloWorld(options) };
    ASSERT_TRUE(std::holds_alternative<Container>(res));
    const auto& container{ std::get<Container>(res) };

    const auto attributes{ container.attributes() };
    ASSERT_TRUE(std::holds_alternative<Document>(attributes));
    const auto& block{ std::get<Document>(attributes) };
    auto it{ block.begin() };
    EXPECT_EQ(it.key(), "d");
    ++it;
    EXPECT_EQ(it.key(), "u");
    EXPECT_EQ(it.value().get<std::string>().size(), acdc::crypto::g_saltChars);

    const auto compacted{ acdc::core::compactBlock(container, acdc::core::BlockLabel::Attributes) };
    ASSERT_TRUE(std::holds_alternative<Container>(compacted));
    const auto& compactAttributes{ std::get<Container>(compacted).attributesBlock() };
    ASSERT_TRUE(compactAttributes.has_value());
    EXPECT_EQ(std::get<acdc::core::CompactBlock>(*compactAttributes).said, block["d"].get<std::string>());
}

TEST(Attestation, RandomSaltsDiffer)
{
    AttestationOptions options{};
    options.privateAttributes = true;

    const auto first{ newHelloWorld(options) };
    const auto second{ newHelloWorld(options) };
    ASSERT_TRUE(std::holds_alternative<Container>(first));
    ASSERT_TRUE(std::holds_alternative<Container>(second));
    EXPECT_NE(std::get<Container>(first).identifier(), std::get<Container>(second).identifier());
}

TEST(Attestation, TargetedPlacesIssueeFirst)
{
    AttestationOptions options{};
    options.target = std::string{ acdc::test_utils::g_kHelloWorldSaid };

    const auto res{ newHelloWorld(options) };
    ASSERT_TRUE(std::holds_alternative<Container>(res));
    const auto attributes{ std::get<Container>(res).attributes() };
    ASSERT_TRUE(std::holds_alternative<Document>(attributes));
    const auto& block{ std::get<Document>(attributes) };
    EXPECT_EQ(block.begin().key(), "i");
    EXPECT_EQ(block["i"].get<std::string>(), std::string{ acdc::test_utils::g_kHelloWorldSaid });
    EXPECT_EQ(block["hello"], "world");
}

TEST(Attestation, RejectsCollidingOrInvalidData)
{
    AttestationOptions targeted{};
    targeted.target = "EIssuee";
    Document withIssuee = Document::object();
    withIssuee["i"] = "someone";
    const auto collision{ acdc::core::newContainer("Issuer", "", std::string{ acdc::test_utils::g_kSchema },
                                                   withIssuee, targeted) };
    ASSERT_TRUE(std::holds_alternative<AcdcError>(collision));
    EXPECT_EQ(std::get<AcdcError>(collision), AcdcError::InvalidField);

    const auto notMapping{ acdc::core::newContainer("Issuer", "", std::string{ acdc::test_utils::g_kSchema },
                                                    Document::array()) };
    ASSERT_TRUE(std::holds_alternative<AcdcError>(notMapping));
    EXPECT_EQ(std::get<AcdcError>(notMapping), AcdcError::InvalidField);

    const auto noSchema{ acdc::core::newContainer("Issuer", "", "", acdc::test_utils::helloWorld()) };
    ASSERT_TRUE(std::holds_alternative<AcdcError>(noSchema));
    EXPECT_EQ(std::get<AcdcError>(noSchema), AcdcError::InvalidField);
}

TEST(Attestation, ParseVerifiesAndExposesFields)
{
    const auto res{ acdc::core::parse(acdc::test_utils::g_kHelloWorldJson) };
    ASSERT_TRUE(std::holds_alternative<Container>(res));
    const auto& container{ std::get<Container>(res) };
    EXPECT_EQ(container.issuer(), "Issuer");
    EXPECT_EQ(container.schema(), "EFNWOR0fQbv_J6EL0pJlvCxEpbu4bg1AurHgr_0A7LKc");
    EXPECT_EQ(container.registry(), "");
    EXPECT_EQ(std::get<Document>(container.attributes()), acdc::test_utils::helloWorld());
    EXPECT_TRUE(acdc::core::verify(container));
}

TEST(Attestation, ParseRejectsTamperedContainer)
{
    std::string tampered{ acdc::test_utils::g_kHelloWorldJson };
    tampered.replace(tampered.find("world"), 5U, "World");
    const auto res{ acdc::core::parse(tampered) };
    ASSERT_TRUE(std::holds_alternative<AcdcError>(res));
    EXPECT_EQ(std::get<AcdcError>(res), AcdcError::DigestMismatch);
}
