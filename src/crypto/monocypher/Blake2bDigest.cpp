#include "acdc/crypto/DigestBackends.hpp"

#include "monocypher.h"

namespace acdc::crypto::backends
{

[[nodiscard]] Digest256 blake2bDigest(std::span<const std::uint8_t> data) noexcept
{
    Digest256 out{};
    crypto_blake2b(out.data(), out.size(), data.empty() ? nullptr : data.data(), data.size());
    return out;
}

} // namespace acdc::crypto::backends
