#ifndef INTERNAL_INCLUDE_ACDC_CRYPTO_DIGESTBACKENDS_HPP
#define INTERNAL_INCLUDE_ACDC_CRYPTO_DIGESTBACKENDS_HPP

#include "acdc/crypto/Digest.hpp"
#include <cstdint>
#include <span>

namespace acdc::crypto::backends
{

[[nodiscard]] Digest256 blake3Digest(std::span<const std::uint8_t> data) noexcept;

[[nodiscard]] Digest256 blake2bDigest(std::span<const std::uint8_t> data) noexcept;

// Blake2s-256, SHA3-256 and SHA2-256 through the OpenSSL EVP interface.
[[nodiscard]] Digest256 openSslDigest(DigestCode code, std::span<const std::uint8_t> data);

} // namespace acdc::crypto::backends

#endif // INTERNAL_INCLUDE_ACDC_CRYPTO_DIGESTBACKENDS_HPP
