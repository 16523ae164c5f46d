#include "acdc/core/EncodingPolicy.hpp"

#include "test_utils/TestUtils.hpp"
#include <cstdlib>
#include <gtest/gtest.h>
#include <optional>
#include <string>
#include <utility>

using acdc::core::EncodingPolicy;
using acdc::core::SerializationKind;
using acdc::crypto::DigestCode;

namespace
{

// Restores an environment variable on scope exit.
class ScopedEnv final
{
public:
    ScopedEnv(std::string name, const char* value) : m_name{ std::move(name) }, m_saved{ acdc::test_utils::getEnv(m_name) }
    {
        set(value);
    }
    ScopedEnv(const ScopedEnv&) = delete;
    ScopedEnv& operator=(const ScopedEnv&) = delete;
    ~ScopedEnv() noexcept
    {
        set(m_saved.has_value() ? m_saved->c_str() : nullptr);
    }

private:
    void set(const char* value) noexcept
    {
        if (value == nullptr)
        {
            (void)::unsetenv(m_name.c_str());
        }
        else
        {
            (void)::setenv(m_name.c_str(), value, 1);
        }
    }

    std::string m_name;
    std::optional<std::string> m_saved;
};

} // namespace

TEST(EncodingPolicy, DefaultIsJsonBlake3)
{
    const EncodingPolicy policy{ acdc::core::defaultEncodingPolicy() };
    EXPECT_EQ(policy.kind, SerializationKind::Json);
    EXPECT_EQ(policy.code, DigestCode::Blake3_256);
}

TEST(EncodingPolicy, ParsesTextualNames)
{
    EXPECT_EQ(acdc::core::parseSerializationKind("CBOR"), SerializationKind::Cbor);
    EXPECT_EQ(acdc::core::parseSerializationKind("MGPK"), SerializationKind::MsgPack);
    EXPECT_EQ(acdc::core::parseSerializationKind("MSGPACK"), SerializationKind::MsgPack);
    EXPECT_FALSE(acdc::core::parseSerializationKind("XML").has_value());

    EXPECT_EQ(acdc::core::parseDigestCode("I"), DigestCode::Sha2_256);
    EXPECT_FALSE(acdc::core::parseDigestCode("EE").has_value());
    EXPECT_FALSE(acdc::core::parseDigestCode("").has_value());
}

TEST(EncodingPolicy, EnvironmentOverridesDefaults)
{
    const ScopedEnv kind{ std::string{ acdc::core::g_kindEnvVar }, "CBOR" };
    const ScopedEnv digest{ std::string{ acdc::core::g_digestEnvVar }, "H" };

    const EncodingPolicy policy{ acdc::core::encodingPolicyFromEnvironment() };
    EXPECT_EQ(policy.kind, SerializationKind::Cbor);
    EXPECT_EQ(policy.code, DigestCode::Sha3_256);
}

TEST(EncodingPolicy, UnrecognizedEnvironmentIsIgnored)
{
    const ScopedEnv kind{ std::string{ acdc::core::g_kindEnvVar }, "YAML" };
    const ScopedEnv digest{ std::string{ acdc::core::g_digestEnvVar }, nullptr };

    EXPECT_EQ(acdc::core::encodingPolicyFromEnvironment(), acdc::core::defaultEncodingPolicy());
}
