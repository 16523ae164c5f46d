#ifndef INCLUDE_ACDC_CORE_ATTESTATION_HPP
#define INCLUDE_ACDC_CORE_ATTESTATION_HPP

#include "acdc/core/AcdcError.hpp"
#include "acdc/core/Container.hpp"
#include "acdc/core/EncodingPolicy.hpp"
#include "acdc/core/Serialization.hpp"
#include "acdc/crypto/Cesr.hpp"
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace acdc::core
{

constexpr const char* g_saltLabel{ "u" };
constexpr const char* g_targetLabel{ "i" };

struct AttestationOptions final
{
    // Issuee identifier, placed under `i` in the attribute block.
    std::optional<std::string> target;
    // Salted, self-addressed attribute block (`d`, `u` first).
    bool privateAttributes{ false };
    // Fixed salt for reproducible output; drawn from the OS CSPRNG when empty.
    std::optional<acdc::crypto::Salt128> salt;
};

// Builds and finalizes a container around `data`. Data keys that collide with a generated
// attribute field give InvalidField. Throws std::runtime_error if a salt is needed and no
// entropy is available.
[[nodiscard]] AcdcResult<Container> newContainer(std::string issuer, std::string registryIdentifier,
                                                 std::string schemaIdentifier, const Document& data,
                                                 const AttestationOptions& options = {},
                                                 const EncodingPolicy& policy = defaultEncodingPolicy());

// Identifier verification followed by decode; a container that fails either is never returned.
[[nodiscard]] AcdcResult<Container> parse(std::span<const std::uint8_t> bytes);
[[nodiscard]] AcdcResult<Container> parse(std::string_view text);

} // namespace acdc::core

#endif // INCLUDE_ACDC_CORE_ATTESTATION_HPP
