#include "acdc/core/ChainValidator.hpp"

#include "acdc/core/Said.hpp"
#include <algorithm>
#include <functional>
#include <map>
#include <utility>
#include <variant>
#include <vector>

namespace acdc::core
{
namespace
{

struct Failure final
{
    AcdcError error{};
    std::string identifier;
    std::string edge;
};

class ChainWalker final
{
public:
    ChainWalker(const acdc::resolver::IContainerResolver& resolver, const ChainValidationOptions& options) noexcept
        : m_resolver(resolver), m_options(options)
    {
    }

    [[nodiscard]] std::optional<Failure> validateNode(const Container& container)
    {
        m_path.push_back(container.identifier());
        auto failure{ validateEdges(container) };
        m_path.pop_back();
        if (!failure)
        {
            m_validated.insert_or_assign(container.identifier(), container.schema());
        }
        return failure;
    }

private:
    [[nodiscard]] std::optional<Failure> validateEdges(const Container& container)
    {
        const auto& edges{ container.edges() };
        if (!edges.has_value())
        {
            return std::nullopt;
        }
        if (std::holds_alternative<CompactBlock>(*edges))
        {
            return Failure{ .error = AcdcError::CompactOnly, .identifier = container.identifier(), .edge = {} };
        }

        bool hasOr{ false };
        bool orSatisfied{ false };
        std::optional<Failure> firstOrFailure{};
        for (const auto& edge : std::get<EdgeSet>(*edges).edges)
        {
            switch (edge.ref.effectiveOperator())
            {
            case EdgeOperator::And:
                if (auto failure{ validateEdge(edge) }; failure)
                {
                    return failure;
                }
                break;
            case EdgeOperator::Or:
                hasOr = true;
                if (orSatisfied)
                {
                    break;
                }
                if (auto failure{ validateEdge(edge) }; !failure)
                {
                    orSatisfied = true;
                }
                else if (failure->error == AcdcError::CycleDetected)
                {
                    return failure;
                }
                else if (!firstOrFailure)
                {
                    firstOrFailure = std::move(failure);
                }
                break;
            case EdgeOperator::Not:
                if (auto failure{ validateEdge(edge) }; !failure)
                {
                    return Failure{ .error = AcdcError::OperatorUnsatisfied,
                                    .identifier = edge.ref.targetIdentifier,
                                    .edge = edge.label };
                }
                else if (failure->error == AcdcError::CycleDetected)
                {
                    return failure;
                }
                break;
            }
        }

        if (hasOr && !orSatisfied)
        {
            return firstOrFailure;
        }
        return std::nullopt;
    }

    [[nodiscard]] std::optional<Failure> validateEdge(const Edge& edge)
    {
        const auto& target{ edge.ref.targetIdentifier };
        const auto fail = [&](AcdcError error) { return Failure{ .error = error, .identifier = target, .edge = edge.label }; };

        if (std::find(m_path.begin(), m_path.end(), target) != m_path.end())
        {
            return fail(AcdcError::CycleDetected);
        }

        if (const auto it{ m_validated.find(target) }; it != m_validated.end())
        {
            if (edge.ref.targetSchema.has_value() && *edge.ref.targetSchema != it->second)
            {
                return fail(AcdcError::SchemaConstraintFailed);
            }
            return std::nullopt;
        }

        const auto bytes{ m_resolver.resolve(target) };
        if (!bytes)
        {
            return fail(AcdcError::NotFound);
        }
        if (m_options.verifyIdentifiers)
        {
            if (const auto verified{ verifyIdentifier(*bytes) }; isError(verified))
            {
                return fail(errorOf(verified));
            }
        }
        const auto decoded{ Container::decode(*bytes) };
        if (isError(decoded))
        {
            return fail(errorOf(decoded));
        }
        const auto& child{ std::get<Container>(decoded) };
        if (child.identifier() != target)
        {
            return fail(AcdcError::DigestMismatch);
        }
        if (edge.ref.targetSchema.has_value() && *edge.ref.targetSchema != child.schema())
        {
            return fail(AcdcError::SchemaConstraintFailed);
        }

        return validateNode(child);
    }

    const acdc::resolver::IContainerResolver& m_resolver;
    ChainValidationOptions m_options;
    std::vector<std::string> m_path;
    std::map<std::string, std::string, std::less<>> m_validated;
};

} // namespace

[[nodiscard]] ValidationResult validateChain(const Container& container,
                                             const acdc::resolver::IContainerResolver& resolver,
                                             const ChainValidationOptions& options)
{
    ValidationResult result{};
    if (options.verifyIdentifiers)
    {
        if (const auto verified{ verifyIdentifier(container.encode()) }; isError(verified))
        {
            result.error = errorOf(verified);
            result.failingIdentifier = container.identifier();
            return result;
        }
    }

    ChainWalker walker{ resolver, options };
    if (auto failure{ walker.validateNode(container) }; failure)
    {
        result.error = failure->error;
        result.failingIdentifier = std::move(failure->identifier);
        result.failingEdge = std::move(failure->edge);
        return result;
    }

    result.valid = true;
    return result;
}

} // namespace acdc::core
