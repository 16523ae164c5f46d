#include "acdc/core/Compaction.hpp"

#include "acdc/core/Said.hpp"
#include "acdc/crypto/Cesr.hpp"
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

namespace acdc::core
{
namespace
{

// Inline content of the block under `label`, or the compact SAID.
struct BlockView final
{
    bool present{ false };
    std::optional<Document> inlineContent;
    std::optional<std::string> compactSaid;
};

template <class Inline> [[nodiscard]] BlockView viewOf(const std::optional<std::variant<Inline, CompactBlock>>& block)
{
    BlockView view{};
    if (!block.has_value())
    {
        return view;
    }
    view.present = true;
    if (const auto* compact{ std::get_if<CompactBlock>(&*block) }; compact != nullptr)
    {
        view.compactSaid = compact->said;
    }
    else if constexpr (std::is_same_v<Inline, EdgeSet>)
    {
        view.inlineContent.emplace(edgesToDocument(std::get<EdgeSet>(*block)));
    }
    else
    {
        view.inlineContent.emplace(std::get<Inline>(*block));
    }
    return view;
}

[[nodiscard]] BlockView viewOf(const ContainerFields& fields, BlockLabel label)
{
    switch (label)
    {
    case BlockLabel::Attributes:
        return viewOf(fields.attributes);
    case BlockLabel::Edges:
        return viewOf(fields.edges);
    case BlockLabel::Rules:
        return viewOf(fields.rules);
    }
    return {};
}

void setCompact(ContainerFields& fields, BlockLabel label, std::string said)
{
    switch (label)
    {
    case BlockLabel::Attributes:
        fields.attributes = AttributesBlock{ CompactBlock{ std::move(said) } };
        break;
    case BlockLabel::Edges:
        fields.edges = EdgesBlock{ CompactBlock{ std::move(said) } };
        break;
    case BlockLabel::Rules:
        fields.rules = RulesBlock{ CompactBlock{ std::move(said) } };
        break;
    }
}

[[nodiscard]] AcdcResult<std::monostate> setInline(ContainerFields& fields, BlockLabel label, const Document& data)
{
    switch (label)
    {
    case BlockLabel::Attributes:
        fields.attributes = AttributesBlock{ std::in_place_type<Document>, data };
        break;
    case BlockLabel::Edges:
    {
        auto edges{ edgesFromDocument(data) };
        if (isError(edges))
        {
            return errorOf(edges);
        }
        fields.edges = EdgesBlock{ std::move(std::get<EdgeSet>(edges)) };
        break;
    }
    case BlockLabel::Rules:
        fields.rules = RulesBlock{ std::in_place_type<Document>, data };
        break;
    }
    return std::monostate{};
}

} // namespace

[[nodiscard]] AcdcResult<std::string> compactBlock(const Document& block, SerializationKind kind,
                                                   acdc::crypto::DigestCode code)
{
    return computeBlockSaid(block, kind, code);
}

[[nodiscard]] AcdcResult<Container> compactBlock(const Container& container, BlockLabel label)
{
    const auto policyRes{ container.encodingPolicy() };
    if (isError(policyRes))
    {
        return errorOf(policyRes);
    }
    const auto& policy{ std::get<EncodingPolicy>(policyRes) };

    const BlockView view{ viewOf(container.fields(), label) };
    if (!view.present)
    {
        return AcdcError::InvalidField;
    }
    if (view.compactSaid.has_value())
    {
        return container;
    }

    auto saidRes{ compactBlock(*view.inlineContent, policy.kind, policy.code) };
    if (isError(saidRes))
    {
        return errorOf(saidRes);
    }

    ContainerFields fields{ container.fields() };
    setCompact(fields, label, std::move(std::get<std::string>(saidRes)));
    return Container::finalize(std::move(fields), policy);
}

[[nodiscard]] AcdcResult<Container> expandBlock(const Container& container, BlockLabel label,
                                                const Document& fullBlockData)
{
    const auto policyRes{ container.encodingPolicy() };
    if (isError(policyRes))
    {
        return errorOf(policyRes);
    }
    const auto& policy{ std::get<EncodingPolicy>(policyRes) };

    const BlockView view{ viewOf(container.fields(), label) };
    if (!view.present || !view.compactSaid.has_value())
    {
        return AcdcError::InvalidField;
    }

    const auto code{ acdc::crypto::saidCode(*view.compactSaid) };
    if (!code)
    {
        return AcdcError::UnknownAlgorithm;
    }
    if (!blockMatchesSaid(fullBlockData, policy.kind, *view.compactSaid))
    {
        return AcdcError::ExpansionMismatch;
    }

    ContainerFields fields{ container.fields() };
    if (const auto res{ setInline(fields, label, fullBlockData) }; isError(res))
    {
        return errorOf(res);
    }
    return Container::finalize(std::move(fields), policy);
}

} // namespace acdc::core
