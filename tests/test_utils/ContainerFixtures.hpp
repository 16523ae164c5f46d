#ifndef ACDC_TESTS_TEST_UTILS_CONTAINERFIXTURES_HPP
#define ACDC_TESTS_TEST_UTILS_CONTAINERFIXTURES_HPP

#include "acdc/core/Container.hpp"
#include "acdc/core/EncodingPolicy.hpp"
#include "acdc/core/Serialization.hpp"
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace acdc::test_utils
{

constexpr std::string_view g_kIssuer{ "Issuer" };
constexpr std::string_view g_kSchema{ "EFNWOR0fQbv_J6EL0pJlvCxEpbu4bg1AurHgr_0A7LKc" };

// {"hello":"world"} container, JSON + Blake3-256.
constexpr std::string_view g_kHelloWorldJson{
    R"({"v":"ACDC10JSON0000aa_","d":"EHaPRLWlw9RkQxgn9BGWzgJwsQy0HtOksqAstXbxo_NB","i":"Issuer","ri":"",)"
    R"("s":"EFNWOR0fQbv_J6EL0pJlvCxEpbu4bg1AurHgr_0A7LKc","a":{"hello":"world"}})"
};
constexpr std::string_view g_kHelloWorldSaid{ "EHaPRLWlw9RkQxgn9BGWzgJwsQy0HtOksqAstXbxo_NB" };

// Same container with the attribute block compacted.
constexpr std::string_view g_kHelloWorldCompactJson{
    R"({"v":"ACDC10JSON0000c7_","d":"EE0d6G5phgBycJN4h36Nkct9GqQ7ic6lPTQ0-1WtBW-u","i":"Issuer","ri":"",)"
    R"("s":"EFNWOR0fQbv_J6EL0pJlvCxEpbu4bg1AurHgr_0A7LKc","a":"EC8dDShjN53SWXTwHL9cAf9uqwTZvoa3T-IdG_QiNSa2"})"
};
constexpr std::string_view g_kHelloWorldAttributesSaid{ "EC8dDShjN53SWXTwHL9cAf9uqwTZvoa3T-IdG_QiNSa2" };

[[nodiscard]] inline acdc::core::Document helloWorld()
{
    acdc::core::Document doc = acdc::core::Document::object();
    doc["hello"] = "world";
    return doc;
}

[[nodiscard]] inline acdc::core::ContainerFields helloWorldFields()
{
    acdc::core::ContainerFields fields{};
    fields.issuer = std::string{ g_kIssuer };
    fields.schemaIdentifier = std::string{ g_kSchema };
    fields.attributes = acdc::core::AttributesBlock{ std::in_place_type<acdc::core::Document>, helloWorld() };
    return fields;
}

[[nodiscard]] inline acdc::core::Edge makeEdge(std::string label, std::string target,
                                               std::optional<acdc::core::EdgeOperator> op = std::nullopt,
                                               std::optional<std::string> schema = std::nullopt)
{
    acdc::core::Edge edge{};
    edge.label = std::move(label);
    edge.ref.targetIdentifier = std::move(target);
    edge.ref.targetSchema = std::move(schema);
    edge.ref.op = op;
    return edge;
}

// Container with attributes {"name": name}, `schema`, and the given inline edges (none when empty).
// Throws std::runtime_error when the container cannot be built.
[[nodiscard]] inline acdc::core::Container makeContainer(std::string_view name, std::vector<acdc::core::Edge> edges = {},
                                                         std::string_view schema = g_kSchema,
                                                         const acdc::core::EncodingPolicy& policy =
                                                             acdc::core::defaultEncodingPolicy())
{
    acdc::core::ContainerFields fields{};
    fields.issuer = std::string{ g_kIssuer };
    fields.schemaIdentifier = std::string{ schema };

    acdc::core::Document data = acdc::core::Document::object();
    data["name"] = std::string{ name };
    fields.attributes = acdc::core::AttributesBlock{ std::in_place_type<acdc::core::Document>, std::move(data) };
    if (!edges.empty())
    {
        fields.edges = acdc::core::EdgesBlock{ acdc::core::EdgeSet{ std::move(edges) } };
    }

    auto built{ acdc::core::Container::build(std::move(fields), policy) };
    if (acdc::core::isError(built))
    {
        throw std::runtime_error("makeContainer: build failed");
    }
    return std::move(std::get<acdc::core::Container>(built));
}

} // namespace acdc::test_utils

#endif // ACDC_TESTS_TEST_UTILS_CONTAINERFIXTURES_HPP
