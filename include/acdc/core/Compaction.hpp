#ifndef INCLUDE_ACDC_CORE_COMPACTION_HPP
#define INCLUDE_ACDC_CORE_COMPACTION_HPP

#include "acdc/core/AcdcError.hpp"
#include "acdc/core/Container.hpp"
#include "acdc/core/Serialization.hpp"
#include "acdc/core/VersionHeader.hpp"
#include "acdc/crypto/Digest.hpp"
#include <string>

namespace acdc::core
{

// SAID that stands in for `block` once it is withheld.
[[nodiscard]] AcdcResult<std::string> compactBlock(const Document& block, SerializationKind kind,
                                                   acdc::crypto::DigestCode code);

// Replaces the inline block under `label` with its SAID and re-finalizes the container.
// A block that is already compact is returned unchanged; an absent block is InvalidField.
[[nodiscard]] AcdcResult<Container> compactBlock(const Container& container, BlockLabel label);

// Discloses `fullBlockData` under `label`. ExpansionMismatch unless it digests to the stored
// compact SAID; InvalidField when the block is absent or already inline.
[[nodiscard]] AcdcResult<Container> expandBlock(const Container& container, BlockLabel label,
                                                const Document& fullBlockData);

} // namespace acdc::core

#endif // INCLUDE_ACDC_CORE_COMPACTION_HPP
