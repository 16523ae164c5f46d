#include "acdc/crypto/Digest.hpp"

#include "acdc/crypto/DigestBackends.hpp"
#include <stdexcept>

namespace acdc::crypto
{

[[nodiscard]] std::optional<DigestCode> digestCodeFromChar(char code) noexcept
{
    switch (code)
    {
    case 'E':
        return DigestCode::Blake3_256;
    case 'F':
        return DigestCode::Blake2b_256;
    case 'G':
        return DigestCode::Blake2s_256;
    case 'H':
        return DigestCode::Sha3_256;
    case 'I':
        return DigestCode::Sha2_256;
    default:
        return std::nullopt;
    }
}

[[nodiscard]] std::string_view digestAlgorithmName(DigestCode code) noexcept
{
    switch (code)
    {
    case DigestCode::Blake3_256:
        return "Blake3-256";
    case DigestCode::Blake2b_256:
        return "Blake2b-256";
    case DigestCode::Blake2s_256:
        return "Blake2s-256";
    case DigestCode::Sha3_256:
        return "SHA3-256";
    case DigestCode::Sha2_256:
        return "SHA2-256";
    }
    return "unknown";
}

[[nodiscard]] Digest256 computeDigest(DigestCode code, std::span<const std::uint8_t> data)
{
    switch (code)
    {
    case DigestCode::Blake3_256:
        return backends::blake3Digest(data);
    case DigestCode::Blake2b_256:
        return backends::blake2bDigest(data);
    case DigestCode::Blake2s_256:
    case DigestCode::Sha3_256:
    case DigestCode::Sha2_256:
        return backends::openSslDigest(code, data);
    }
    throw std::invalid_argument("computeDigest: unsupported digest code");
}

} // namespace acdc::crypto
