#include "acdc/core/Attestation.hpp"

#include "acdc/core/Said.hpp"
#include "acdc/security/SecureRandom.hpp"
#include <utility>
#include <variant>

namespace acdc::core
{
namespace
{

[[nodiscard]] AcdcResult<Document> attributeBlock(const Document& data, const AttestationOptions& options,
                                                  const EncodingPolicy& policy)
{
    if (!data.is_object())
    {
        return AcdcError::InvalidField;
    }
    if (options.target.has_value() && options.target->empty())
    {
        return AcdcError::InvalidField;
    }

    Document block = Document::object();
    if (options.privateAttributes)
    {
        if (data.contains(g_identifierLabel) || data.contains(g_saltLabel))
        {
            return AcdcError::InvalidField;
        }
        const auto salt{ options.salt.has_value() ? *options.salt : acdc::security::secureRandomSalt() };
        block[g_identifierLabel] = std::string{};
        block[g_saltLabel] = acdc::crypto::encodeSalt(salt);
    }
    if (options.target.has_value())
    {
        if (data.contains(g_targetLabel))
        {
            return AcdcError::InvalidField;
        }
        block[g_targetLabel] = *options.target;
    }
    for (const auto& [key, value] : data.items())
    {
        block[key] = value;
    }

    if (!options.privateAttributes)
    {
        return block;
    }
    return saidifyBlock(block, policy.kind, policy.code);
}

} // namespace

[[nodiscard]] AcdcResult<Container> newContainer(std::string issuer, std::string registryIdentifier,
                                                 std::string schemaIdentifier, const Document& data,
                                                 const AttestationOptions& options, const EncodingPolicy& policy)
{
    auto blockRes{ attributeBlock(data, options, policy) };
    if (isError(blockRes))
    {
        return errorOf(blockRes);
    }

    ContainerFields fields{};
    fields.issuer = std::move(issuer);
    fields.registryIdentifier = std::move(registryIdentifier);
    fields.schemaIdentifier = std::move(schemaIdentifier);
    fields.attributes = AttributesBlock{ std::in_place_type<Document>, std::move(std::get<Document>(blockRes)) };
    return Container::build(std::move(fields), policy);
}

[[nodiscard]] AcdcResult<Container> parse(std::span<const std::uint8_t> bytes)
{
    if (const auto verified{ verifyIdentifier(bytes) }; isError(verified))
    {
        return errorOf(verified);
    }
    return Container::decode(bytes);
}

[[nodiscard]] AcdcResult<Container> parse(std::string_view text)
{
    return parse(asByteSpan(text));
}

} // namespace acdc::core
