#include "acdc/core/Container.hpp"

#include "acdc/core/Said.hpp"
#include "acdc/crypto/Cesr.hpp"
#include <algorithm>
#include <array>
#include <cstddef>
#include <functional>
#include <iterator>
#include <set>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace acdc::core
{
namespace
{

constexpr const char* g_kIssuerLabel{ "i" };
constexpr const char* g_kRegistryLabel{ "ri" };
constexpr const char* g_kSchemaLabel{ "s" };
constexpr const char* g_kAttributesLabel{ "a" };
constexpr const char* g_kEdgesLabel{ "e" };
constexpr const char* g_kRulesLabel{ "r" };

constexpr const char* g_kEdgeTargetLabel{ "n" };
constexpr const char* g_kEdgeSchemaLabel{ "s" };
constexpr const char* g_kEdgeOperatorLabel{ "o" };

// Top-level labels in their only permitted order.
constexpr std::array<std::string_view, 8> g_kFieldOrder{ "v", "d", "i", "ri", "s", "a", "e", "r" };

[[nodiscard]] std::optional<std::size_t> fieldPosition(std::string_view key) noexcept
{
    for (std::size_t i{}; i < g_kFieldOrder.size(); ++i)
    {
        if (g_kFieldOrder[i] == key)
        {
            return i;
        }
    }
    return std::nullopt;
}

[[nodiscard]] bool isCompactWellFormed(const CompactBlock& block) noexcept
{
    return acdc::crypto::isWellFormedSaid(block.said);
}

template <class Inline> [[nodiscard]] Document blockToDocument(const std::variant<Inline, CompactBlock>& block)
{
    if (const auto* compact{ std::get_if<CompactBlock>(&block) }; compact != nullptr)
    {
        return Document(compact->said);
    }
    if constexpr (std::is_same_v<Inline, EdgeSet>)
    {
        return edgesToDocument(std::get<EdgeSet>(block));
    }
    else
    {
        return std::get<Inline>(block);
    }
}

[[nodiscard]] Document fieldsToDocument(const ContainerFields& fields)
{
    Document doc = Document::object();
    doc[g_kIssuerLabel] = fields.issuer;
    doc[g_kRegistryLabel] = fields.registryIdentifier;
    doc[g_kSchemaLabel] = fields.schemaIdentifier;
    if (fields.attributes.has_value())
    {
        doc[g_kAttributesLabel] = blockToDocument(*fields.attributes);
    }
    if (fields.edges.has_value())
    {
        doc[g_kEdgesLabel] = blockToDocument(*fields.edges);
    }
    if (fields.rules.has_value())
    {
        doc[g_kRulesLabel] = blockToDocument(*fields.rules);
    }
    return doc;
}

[[nodiscard]] AcdcResult<std::monostate> validateMappingBlock(const std::variant<Document, CompactBlock>& block)
{
    if (const auto* compact{ std::get_if<CompactBlock>(&block) }; compact != nullptr)
    {
        return isCompactWellFormed(*compact) ? AcdcResult<std::monostate>{ std::monostate{} }
                                             : AcdcResult<std::monostate>{ AcdcError::InvalidField };
    }
    if (!std::get<Document>(block).is_object())
    {
        return AcdcError::InvalidField;
    }
    return std::monostate{};
}

[[nodiscard]] AcdcResult<std::monostate> validateEdges(const EdgesBlock& block)
{
    if (const auto* compact{ std::get_if<CompactBlock>(&block) }; compact != nullptr)
    {
        return isCompactWellFormed(*compact) ? AcdcResult<std::monostate>{ std::monostate{} }
                                             : AcdcResult<std::monostate>{ AcdcError::InvalidField };
    }

    std::set<std::string, std::less<>> labels{};
    for (const auto& edge : std::get<EdgeSet>(block).edges)
    {
        if (edge.label.empty() || !labels.insert(edge.label).second)
        {
            return AcdcError::InvalidField;
        }
        if (!acdc::crypto::isWellFormedSaid(edge.ref.targetIdentifier))
        {
            return AcdcError::InvalidField;
        }
        if (edge.ref.targetSchema.has_value() && edge.ref.targetSchema->empty())
        {
            return AcdcError::InvalidField;
        }
    }
    return std::monostate{};
}

[[nodiscard]] AcdcResult<std::monostate> validateFields(const ContainerFields& fields)
{
    if (fields.issuer.empty() || fields.schemaIdentifier.empty())
    {
        return AcdcError::InvalidField;
    }
    if (fields.attributes.has_value())
    {
        if (auto res{ validateMappingBlock(*fields.attributes) }; isError(res))
        {
            return res;
        }
    }
    if (fields.edges.has_value())
    {
        if (auto res{ validateEdges(*fields.edges) }; isError(res))
        {
            return res;
        }
    }
    if (fields.rules.has_value())
    {
        if (auto res{ validateMappingBlock(*fields.rules) }; isError(res))
        {
            return res;
        }
    }
    return std::monostate{};
}

[[nodiscard]] AcdcResult<std::variant<Document, CompactBlock>> mappingOrCompact(const Document& value)
{
    if (value.is_object())
    {
        return std::variant<Document, CompactBlock>{ std::in_place_type<Document>, value };
    }
    if (value.is_string() && acdc::crypto::isWellFormedSaid(value.get_ref<const std::string&>()))
    {
        return std::variant<Document, CompactBlock>{ CompactBlock{ value.get<std::string>() } };
    }
    return AcdcError::InvalidField;
}

[[nodiscard]] AcdcResult<std::string> requiredString(const Document& doc, const char* label)
{
    const auto it{ doc.find(label) };
    if (it == doc.end() || !it->is_string())
    {
        return AcdcError::InvalidField;
    }
    return it->get<std::string>();
}

struct DecodedFields final
{
    std::string identifier;
    ContainerFields fields;
};

[[nodiscard]] AcdcResult<DecodedFields> fieldsFromDocument(const Document& doc)
{
    std::optional<std::size_t> previous{};
    for (const auto& item : doc.items())
    {
        const auto position{ fieldPosition(item.key()) };
        if (!position || (previous.has_value() && *position <= *previous))
        {
            return AcdcError::InvalidField;
        }
        previous = position;
    }

    DecodedFields out{};
    auto identifier{ requiredString(doc, g_identifierLabel) };
    auto issuer{ requiredString(doc, g_kIssuerLabel) };
    auto registry{ requiredString(doc, g_kRegistryLabel) };
    auto schema{ requiredString(doc, g_kSchemaLabel) };
    if (isError(identifier) || isError(issuer) || isError(registry) || isError(schema))
    {
        return AcdcError::InvalidField;
    }
    out.identifier = std::move(std::get<std::string>(identifier));
    out.fields.issuer = std::move(std::get<std::string>(issuer));
    out.fields.registryIdentifier = std::move(std::get<std::string>(registry));
    out.fields.schemaIdentifier = std::move(std::get<std::string>(schema));

    if (const auto it{ doc.find(g_kAttributesLabel) }; it != doc.end())
    {
        auto block{ mappingOrCompact(*it) };
        if (isError(block))
        {
            return errorOf(block);
        }
        out.fields.attributes = std::move(std::get<std::variant<Document, CompactBlock>>(block));
    }

    if (const auto it{ doc.find(g_kEdgesLabel) }; it != doc.end())
    {
        if (it->is_string() && acdc::crypto::isWellFormedSaid(it->get_ref<const std::string&>()))
        {
            out.fields.edges = EdgesBlock{ CompactBlock{ it->get<std::string>() } };
        }
        else
        {
            auto edges{ edgesFromDocument(*it) };
            if (isError(edges))
            {
                return errorOf(edges);
            }
            out.fields.edges = EdgesBlock{ std::move(std::get<EdgeSet>(edges)) };
        }
    }

    if (const auto it{ doc.find(g_kRulesLabel) }; it != doc.end())
    {
        auto block{ mappingOrCompact(*it) };
        if (isError(block))
        {
            return errorOf(block);
        }
        out.fields.rules = std::move(std::get<std::variant<Document, CompactBlock>>(block));
    }

    return out;
}

} // namespace

[[nodiscard]] std::string_view blockLabelKey(BlockLabel label) noexcept
{
    switch (label)
    {
    case BlockLabel::Attributes:
        return g_kAttributesLabel;
    case BlockLabel::Edges:
        return g_kEdgesLabel;
    case BlockLabel::Rules:
        return g_kRulesLabel;
    }
    return g_kAttributesLabel;
}

[[nodiscard]] std::optional<BlockLabel> blockLabelFromKey(std::string_view key) noexcept
{
    constexpr std::array<BlockLabel, 3> kLabels{ BlockLabel::Attributes, BlockLabel::Edges, BlockLabel::Rules };
    for (const auto label : kLabels)
    {
        if (blockLabelKey(label) == key)
        {
            return label;
        }
    }
    return std::nullopt;
}

[[nodiscard]] std::string_view edgeOperatorName(EdgeOperator op) noexcept
{
    switch (op)
    {
    case EdgeOperator::And:
        return "AND";
    case EdgeOperator::Or:
        return "OR";
    case EdgeOperator::Not:
        return "NOT";
    }
    return "AND";
}

[[nodiscard]] std::optional<EdgeOperator> edgeOperatorFromName(std::string_view name) noexcept
{
    constexpr std::array<EdgeOperator, 3> kOperators{ EdgeOperator::And, EdgeOperator::Or, EdgeOperator::Not };
    for (const auto op : kOperators)
    {
        if (edgeOperatorName(op) == name)
        {
            return op;
        }
    }
    return std::nullopt;
}

[[nodiscard]] Document edgesToDocument(const EdgeSet& edges)
{
    Document doc = Document::object();
    for (const auto& edge : edges.edges)
    {
        Document ref = Document::object();
        ref[g_kEdgeTargetLabel] = edge.ref.targetIdentifier;
        if (edge.ref.targetSchema.has_value())
        {
            ref[g_kEdgeSchemaLabel] = *edge.ref.targetSchema;
        }
        if (edge.ref.op.has_value())
        {
            ref[g_kEdgeOperatorLabel] = std::string{ edgeOperatorName(*edge.ref.op) };
        }
        doc[edge.label] = std::move(ref);
    }
    return doc;
}

[[nodiscard]] AcdcResult<EdgeSet> edgesFromDocument(const Document& doc)
{
    if (!doc.is_object())
    {
        return AcdcError::InvalidField;
    }

    EdgeSet out{};
    for (const auto& [label, value] : doc.items())
    {
        if (!value.is_object())
        {
            return AcdcError::InvalidField;
        }

        Edge edge{};
        edge.label = label;
        for (const auto& [key, field] : value.items())
        {
            if (!field.is_string())
            {
                return AcdcError::InvalidField;
            }
            const auto& text{ field.get_ref<const std::string&>() };
            if (key == g_kEdgeTargetLabel)
            {
                edge.ref.targetIdentifier = text;
            }
            else if (key == g_kEdgeSchemaLabel)
            {
                edge.ref.targetSchema = text;
            }
            else if (key == g_kEdgeOperatorLabel)
            {
                const auto op{ edgeOperatorFromName(text) };
                if (!op)
                {
                    return AcdcError::InvalidField;
                }
                edge.ref.op = *op;
            }
            else
            {
                return AcdcError::InvalidField;
            }
        }

        if (edge.ref.targetIdentifier.empty())
        {
            return AcdcError::InvalidField;
        }
        out.edges.push_back(std::move(edge));
    }
    return out;
}

Container::Container(VersionHeader version, std::string identifier, ContainerFields fields) noexcept
    : m_version(version), m_identifier(std::move(identifier)), m_fields(std::move(fields))
{
}

[[nodiscard]] AcdcResult<Container> Container::build(ContainerFields fields, const EncodingPolicy& policy)
{
    if (!fields.attributes.has_value())
    {
        return AcdcError::InvalidField;
    }
    return finalize(std::move(fields), policy);
}

[[nodiscard]] AcdcResult<Container> Container::finalize(ContainerFields fields, const EncodingPolicy& policy)
{
    if (auto valid{ validateFields(fields) }; isError(valid))
    {
        return errorOf(valid);
    }

    auto finalized{ computeIdentifier(fieldsToDocument(fields), policy.kind, policy.code) };
    if (isError(finalized))
    {
        return errorOf(finalized);
    }

    auto& out{ std::get<FinalizedBytes>(finalized) };
    return Container{ out.header, std::move(out.identifier), std::move(fields) };
}

[[nodiscard]] AcdcResult<Container> Container::decode(std::span<const std::uint8_t> bytes)
{
    const auto kind{ detectKind(bytes) };
    if (!kind)
    {
        return AcdcError::UnsupportedKind;
    }

    const auto docRes{ deserialize(*kind, bytes) };
    if (isError(docRes))
    {
        return errorOf(docRes);
    }
    const auto& doc{ std::get<Document>(docRes) };
    if (!doc.is_object())
    {
        return AcdcError::ParseError;
    }
    if (doc.empty() || doc.begin().key() != g_versionLabel || !doc.begin().value().is_string())
    {
        return AcdcError::MalformedHeader;
    }

    const auto headerRes{ decodeVersionHeader(doc.begin().value().get_ref<const std::string&>()) };
    if (isError(headerRes))
    {
        return errorOf(headerRes);
    }
    const auto header{ std::get<VersionHeader>(headerRes) };
    if (header.majorVersion != g_protocolMajorVersion)
    {
        return AcdcError::MalformedHeader;
    }
    if (header.kind != *kind)
    {
        return AcdcError::UnsupportedKind;
    }
    if (const auto second{ std::next(doc.begin()) };
        second == doc.end() || second.key() != g_identifierLabel || !second.value().is_string())
    {
        return AcdcError::ParseError;
    }

    auto decoded{ fieldsFromDocument(doc) };
    if (isError(decoded))
    {
        return errorOf(decoded);
    }
    auto& out{ std::get<DecodedFields>(decoded) };
    Container container{ header, std::move(out.identifier), std::move(out.fields) };

    // Only the canonical encoding is accepted, so encode() reproduces the input exactly.
    const auto canonical{ serialize(header.kind, container.toDocument()) };
    if (isError(canonical))
    {
        return AcdcError::ParseError;
    }
    const auto& reencoded{ std::get<Bytes>(canonical) };
    if (!std::equal(reencoded.begin(), reencoded.end(), bytes.begin(), bytes.end()))
    {
        return AcdcError::ParseError;
    }
    return container;
}

[[nodiscard]] AcdcResult<Container> Container::decode(std::string_view text)
{
    return decode(asByteSpan(text));
}

[[nodiscard]] AcdcResult<Document> Container::attributes() const
{
    if (!m_fields.attributes.has_value())
    {
        return AcdcError::InvalidField;
    }
    if (std::holds_alternative<CompactBlock>(*m_fields.attributes))
    {
        return AcdcError::CompactOnly;
    }
    return std::get<Document>(*m_fields.attributes);
}

[[nodiscard]] AcdcResult<Document> Container::attributes(const Document& expansionSource) const
{
    if (!m_fields.attributes.has_value())
    {
        return AcdcError::InvalidField;
    }
    const auto* compact{ std::get_if<CompactBlock>(&*m_fields.attributes) };
    if (compact == nullptr)
    {
        return std::get<Document>(*m_fields.attributes);
    }

    const auto code{ acdc::crypto::saidCode(compact->said) };
    if (!code)
    {
        return AcdcError::UnknownAlgorithm;
    }
    if (!blockMatchesSaid(expansionSource, m_version.kind, compact->said))
    {
        return AcdcError::ExpansionMismatch;
    }
    return expansionSource;
}

[[nodiscard]] std::optional<acdc::crypto::DigestCode> Container::digestCode() const noexcept
{
    return acdc::crypto::saidCode(m_identifier);
}

[[nodiscard]] AcdcResult<EncodingPolicy> Container::encodingPolicy() const
{
    const auto code{ digestCode() };
    if (!code)
    {
        return AcdcError::UnknownAlgorithm;
    }
    return EncodingPolicy{ .kind = m_version.kind, .code = *code };
}

[[nodiscard]] Bytes Container::encode() const
{
    auto bytes{ serialize(m_version.kind, toDocument()) };
    if (isError(bytes))
    {
        throw std::logic_error("Container::encode: stored representation is not serializable");
    }
    return std::move(std::get<Bytes>(bytes));
}

[[nodiscard]] std::string Container::encodeToString() const
{
    const Bytes bytes{ encode() };
    return std::string(bytes.begin(), bytes.end());
}

[[nodiscard]] AcdcResult<Container> Container::encode(SerializationKind kind) const
{
    auto policy{ encodingPolicy() };
    if (isError(policy))
    {
        return errorOf(policy);
    }
    auto target{ std::get<EncodingPolicy>(policy) };
    target.kind = kind;
    return finalize(m_fields, target);
}

[[nodiscard]] Document Container::toDocument() const
{
    const auto version{ encodeVersionHeader(m_version) };
    if (isError(version))
    {
        throw std::logic_error("Container::toDocument: stored header is not encodable");
    }

    Document doc = Document::object();
    doc[g_versionLabel] = std::get<std::string>(version);
    doc[g_identifierLabel] = m_identifier;
    const Document fields = fieldsToDocument(m_fields);
    for (const auto& [key, value] : fields.items())
    {
        doc[key] = value;
    }
    return doc;
}

[[nodiscard]] bool verify(const Container& container)
{
    return verify(container.encode());
}

[[nodiscard]] bool verify(std::span<const std::uint8_t> bytes)
{
    return !isError(verifyIdentifier(bytes)) && !isError(Container::decode(bytes));
}

} // namespace acdc::core
