#include "acdc/core/EncodingPolicy.hpp"

#include <cstdlib>
#include <string>

namespace acdc::core
{
namespace
{

[[nodiscard]] std::optional<std::string_view> envValue(std::string_view name)
{
    const char* value{ std::getenv(std::string{ name }.c_str()) };
    if (value == nullptr || *value == '\0')
    {
        return std::nullopt;
    }
    return std::string_view{ value };
}

} // namespace

[[nodiscard]] EncodingPolicy defaultEncodingPolicy() noexcept
{
    return EncodingPolicy{
        .kind = SerializationKind::Json,
        .code = acdc::crypto::DigestCode::Blake3_256,
    };
}

[[nodiscard]] EncodingPolicy encodingPolicyFromEnvironment()
{
    EncodingPolicy policy{ defaultEncodingPolicy() };

    if (const auto kindText{ envValue(g_kindEnvVar) }; kindText.has_value())
    {
        if (const auto kind{ parseSerializationKind(*kindText) }; kind.has_value())
        {
            policy.kind = *kind;
        }
    }
    if (const auto codeText{ envValue(g_digestEnvVar) }; codeText.has_value())
    {
        if (const auto code{ parseDigestCode(*codeText) }; code.has_value())
        {
            policy.code = *code;
        }
    }
    return policy;
}

[[nodiscard]] std::optional<SerializationKind> parseSerializationKind(std::string_view text) noexcept
{
    if (text == "MSGPACK")
    {
        return SerializationKind::MsgPack;
    }
    return kindFromCode(text);
}

[[nodiscard]] std::optional<acdc::crypto::DigestCode> parseDigestCode(std::string_view text) noexcept
{
    if (text.size() != 1U)
    {
        return std::nullopt;
    }
    return acdc::crypto::digestCodeFromChar(text.front());
}

} // namespace acdc::core
