#ifndef INCLUDE_ACDC_CRYPTO_DIGEST_HPP
#define INCLUDE_ACDC_CRYPTO_DIGEST_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

namespace acdc::crypto
{

// Self-addressing digest family. The enumerator value is the one-character code prefix.
enum class DigestCode : char
{
    Blake3_256 = 'E',
    Blake2b_256 = 'F',
    Blake2s_256 = 'G',
    Sha3_256 = 'H',
    Sha2_256 = 'I',
};

constexpr std::size_t g_digestBytes{ 32U };
constexpr std::size_t g_saidChars{ 44U };

using Digest256 = std::array<std::uint8_t, g_digestBytes>;

[[nodiscard]] std::optional<DigestCode> digestCodeFromChar(char code) noexcept;

[[nodiscard]] constexpr char digestCodeChar(DigestCode code) noexcept
{
    return static_cast<char>(code);
}

[[nodiscard]] std::string_view digestAlgorithmName(DigestCode code) noexcept;

// Textual SAID length for a code. All supported codes are 256-bit digests with a one-character code.
[[nodiscard]] constexpr std::size_t saidLength([[maybe_unused]] DigestCode code) noexcept
{
    return g_saidChars;
}

// Throws std::invalid_argument for a value outside the enum; std::runtime_error on backend failure.
[[nodiscard]] Digest256 computeDigest(DigestCode code, std::span<const std::uint8_t> data);

} // namespace acdc::crypto

#endif // INCLUDE_ACDC_CRYPTO_DIGEST_HPP
