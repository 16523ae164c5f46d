#ifndef INCLUDE_ACDC_CORE_ENCODINGPOLICY_HPP
#define INCLUDE_ACDC_CORE_ENCODINGPOLICY_HPP

#include "acdc/core/VersionHeader.hpp"
#include "acdc/crypto/Digest.hpp"
#include <optional>
#include <string_view>

namespace acdc::core
{

constexpr std::string_view g_kindEnvVar{ "ACDC_SERIALIZATION" };
constexpr std::string_view g_digestEnvVar{ "ACDC_DIGEST" };

struct EncodingPolicy final
{
    SerializationKind kind{ SerializationKind::Json };
    acdc::crypto::DigestCode code{ acdc::crypto::DigestCode::Blake3_256 };

    friend bool operator==(const EncodingPolicy&, const EncodingPolicy&) = default;
};

[[nodiscard]] EncodingPolicy defaultEncodingPolicy() noexcept;

// Default policy overlaid with ACDC_SERIALIZATION / ACDC_DIGEST; unrecognized values are ignored.
[[nodiscard]] EncodingPolicy encodingPolicyFromEnvironment();

[[nodiscard]] std::optional<SerializationKind> parseSerializationKind(std::string_view text) noexcept;

[[nodiscard]] std::optional<acdc::crypto::DigestCode> parseDigestCode(std::string_view text) noexcept;

} // namespace acdc::core

#endif // INCLUDE_ACDC_CORE_ENCODINGPOLICY_HPP
