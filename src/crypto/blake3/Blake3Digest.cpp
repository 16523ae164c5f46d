#include "acdc/crypto/DigestBackends.hpp"

extern "C" {
#include <blake3.h>
}

namespace acdc::crypto::backends
{

[[nodiscard]] Digest256 blake3Digest(std::span<const std::uint8_t> data) noexcept
{
    blake3_hasher hasher{};
    blake3_hasher_init(&hasher);
    if (!data.empty())
    {
        blake3_hasher_update(&hasher, data.data(), data.size());
    }

    Digest256 out{};
    blake3_hasher_finalize(&hasher, out.data(), out.size());
    return out;
}

} // namespace acdc::crypto::backends
