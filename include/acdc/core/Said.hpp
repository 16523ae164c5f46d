#ifndef INCLUDE_ACDC_CORE_SAID_HPP
#define INCLUDE_ACDC_CORE_SAID_HPP

#include "acdc/core/AcdcError.hpp"
#include "acdc/core/Serialization.hpp"
#include "acdc/core/VersionHeader.hpp"
#include "acdc/crypto/Digest.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <variant>

namespace acdc::core
{

constexpr const char* g_versionLabel{ "v" };
constexpr const char* g_identifierLabel{ "d" };

struct FinalizedBytes final
{
    Bytes bytes;
    std::string identifier;
    VersionHeader header{};
};

// Two-pass placeholder algorithm. `doc` supplies every field except `v` and `d`, which are
// (re)placed at the front; the result carries the final size header and the substituted identifier.
// Throws std::logic_error if the digest encoding contract is broken.
[[nodiscard]] AcdcResult<FinalizedBytes> computeIdentifier(const Document& doc, SerializationKind kind,
                                                           acdc::crypto::DigestCode code);

// Re-digests the original bytes with only the identifier span replaced by its placeholder.
[[nodiscard]] AcdcResult<std::monostate> verifyIdentifier(std::span<const std::uint8_t> bytes);

// SAID of a nested block treated as a standalone sub-document. A top-level `d` in the block is
// replaced by the placeholder before digesting; a block without `d` is digested as-is.
[[nodiscard]] AcdcResult<std::string> computeBlockSaid(const Document& block, SerializationKind kind,
                                                       acdc::crypto::DigestCode code);

// True when `block` digests to `said` under the code `said` carries. A block with its own `d`
// must also name `said` there, since `d` is replaced by the placeholder before digesting.
[[nodiscard]] bool blockMatchesSaid(const Document& block, SerializationKind kind, std::string_view said);

// Returns a copy of `block` with `d` (inserted first when missing) set to its own SAID.
[[nodiscard]] AcdcResult<Document> saidifyBlock(const Document& block, SerializationKind kind,
                                                acdc::crypto::DigestCode code);

} // namespace acdc::core

#endif // INCLUDE_ACDC_CORE_SAID_HPP
