#ifndef INCLUDE_ACDC_CORE_CONTAINER_HPP
#define INCLUDE_ACDC_CORE_CONTAINER_HPP

#include "acdc/core/AcdcError.hpp"
#include "acdc/core/EncodingPolicy.hpp"
#include "acdc/core/Serialization.hpp"
#include "acdc/core/VersionHeader.hpp"
#include "acdc/crypto/Digest.hpp"
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace acdc::core
{

enum class BlockLabel : std::uint8_t
{
    Attributes,
    Edges,
    Rules,
};

[[nodiscard]] std::string_view blockLabelKey(BlockLabel label) noexcept;

[[nodiscard]] std::optional<BlockLabel> blockLabelFromKey(std::string_view key) noexcept;

// A block disclosed only through its SAID.
struct CompactBlock final
{
    std::string said;

    friend bool operator==(const CompactBlock&, const CompactBlock&) = default;
};

enum class EdgeOperator : std::uint8_t
{
    And,
    Or,
    Not,
};

[[nodiscard]] std::string_view edgeOperatorName(EdgeOperator op) noexcept;

[[nodiscard]] std::optional<EdgeOperator> edgeOperatorFromName(std::string_view name) noexcept;

// Wire form: label -> { "n": target, "s": schema (optional), "o": operator (optional) }
struct EdgeRef final
{
    std::string targetIdentifier;
    std::optional<std::string> targetSchema;
    std::optional<EdgeOperator> op;

    [[nodiscard]] EdgeOperator effectiveOperator() const noexcept
    {
        return op.value_or(EdgeOperator::And);
    }

    friend bool operator==(const EdgeRef&, const EdgeRef&) = default;
};

struct Edge final
{
    std::string label;
    EdgeRef ref;

    friend bool operator==(const Edge&, const Edge&) = default;
};

// Inline edges in declaration order.
struct EdgeSet final
{
    std::vector<Edge> edges;

    friend bool operator==(const EdgeSet&, const EdgeSet&) = default;
};

using AttributesBlock = std::variant<Document, CompactBlock>;
using EdgesBlock = std::variant<EdgeSet, CompactBlock>;
using RulesBlock = std::variant<Document, CompactBlock>;

struct ContainerFields final
{
    std::string issuer;
    std::string registryIdentifier;
    std::string schemaIdentifier;
    std::optional<AttributesBlock> attributes;
    std::optional<EdgesBlock> edges;
    std::optional<RulesBlock> rules;

    friend bool operator==(const ContainerFields&, const ContainerFields&) = default;
};

[[nodiscard]] Document edgesToDocument(const EdgeSet& edges);

[[nodiscard]] AcdcResult<EdgeSet> edgesFromDocument(const Document& doc);

// Immutable once built: the identifier and the size header are fixed for its current representation.
class Container final
{
public:
    // Validates the fields (InvalidField) and finalizes the identifier for `policy`.
    [[nodiscard]] static AcdcResult<Container> build(ContainerFields fields,
                                                     const EncodingPolicy& policy = defaultEncodingPolicy());

    // Finalizes any representation, including one without an attribute block.
    [[nodiscard]] static AcdcResult<Container> finalize(ContainerFields fields, const EncodingPolicy& policy);

    // Structural decode; does not verify the identifier. Input that is not in the canonical
    // encoding of its kind (extra whitespace, reordered or duplicate keys) is a ParseError.
    [[nodiscard]] static AcdcResult<Container> decode(std::span<const std::uint8_t> bytes);
    [[nodiscard]] static AcdcResult<Container> decode(std::string_view text);

    [[nodiscard]] const VersionHeader& version() const noexcept
    {
        return m_version;
    }
    [[nodiscard]] const std::string& identifier() const noexcept
    {
        return m_identifier;
    }
    [[nodiscard]] const std::string& issuer() const noexcept
    {
        return m_fields.issuer;
    }
    [[nodiscard]] const std::string& registry() const noexcept
    {
        return m_fields.registryIdentifier;
    }
    [[nodiscard]] const std::string& schema() const noexcept
    {
        return m_fields.schemaIdentifier;
    }
    [[nodiscard]] const ContainerFields& fields() const noexcept
    {
        return m_fields;
    }
    [[nodiscard]] const std::optional<AttributesBlock>& attributesBlock() const noexcept
    {
        return m_fields.attributes;
    }
    [[nodiscard]] const std::optional<EdgesBlock>& edges() const noexcept
    {
        return m_fields.edges;
    }
    [[nodiscard]] const std::optional<RulesBlock>& rules() const noexcept
    {
        return m_fields.rules;
    }

    // Inline attribute data. CompactOnly when only the SAID was disclosed; InvalidField when absent.
    [[nodiscard]] AcdcResult<Document> attributes() const;

    // Inline attribute data, or `expansionSource` once it is proven to match the compact SAID.
    [[nodiscard]] AcdcResult<Document> attributes(const Document& expansionSource) const;

    [[nodiscard]] std::optional<acdc::crypto::DigestCode> digestCode() const noexcept;

    // Kind of this container plus the digest code of its identifier.
    [[nodiscard]] AcdcResult<EncodingPolicy> encodingPolicy() const;

    // Canonical bytes of the current representation, identifier and header as stored.
    [[nodiscard]] Bytes encode() const;
    [[nodiscard]] std::string encodeToString() const;

    // Same logical content re-finalized in another kind; the identifier changes with the bytes.
    [[nodiscard]] AcdcResult<Container> encode(SerializationKind kind) const;

    [[nodiscard]] Document toDocument() const;

    friend bool operator==(const Container&, const Container&) = default;

private:
    Container(VersionHeader version, std::string identifier, ContainerFields fields) noexcept;

    VersionHeader m_version{};
    std::string m_identifier;
    ContainerFields m_fields;
};

// True only when the encoded container passes every integrity check.
[[nodiscard]] bool verify(const Container& container);

[[nodiscard]] bool verify(std::span<const std::uint8_t> bytes);

} // namespace acdc::core

#endif // INCLUDE_ACDC_CORE_CONTAINER_HPP
