#ifndef INCLUDE_ACDC_CORE_CHAINVALIDATOR_HPP
#define INCLUDE_ACDC_CORE_CHAINVALIDATOR_HPP

#include "acdc/core/AcdcError.hpp"
#include "acdc/core/Container.hpp"
#include "acdc/resolver/IContainerResolver.hpp"
#include <optional>
#include <string>

namespace acdc::core
{

struct ValidationResult final
{
    bool valid{ false };
    // First failure in edge declaration order, depth first.
    std::optional<AcdcError> error;
    // Container that could not be accepted: the edge target, or the holder of a compact edge block.
    std::string failingIdentifier;
    // Label of the edge that led to the failure; empty when the root itself failed.
    std::string failingEdge;
};

struct ChainValidationOptions final
{
    // Re-verify the root and every resolved container. May be turned off when the resolver only
    // serves containers it verified on ingest (IContainerStore::put).
    bool verifyIdentifiers{ true };
};

// Verifies `container` and walks its edges through `resolver`.
//  AND: every edge must validate; evaluation stops at the first failure.
//  OR:  at least one OR edge must validate; later OR edges are not resolved once one passes.
//  NOT: the edge must fail validation or be unresolvable.
// A cycle on the current path is fatal under every operator. Edges are evaluated sequentially
// and a target reached again through another path is not re-resolved.
[[nodiscard]] ValidationResult validateChain(const Container& container,
                                             const acdc::resolver::IContainerResolver& resolver,
                                             const ChainValidationOptions& options = {});

} // namespace acdc::core

#endif // INCLUDE_ACDC_CORE_CHAINVALIDATOR_HPP
