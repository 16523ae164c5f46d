#ifndef INCLUDE_ACDC_CRYPTO_CESR_HPP
#define INCLUDE_ACDC_CRYPTO_CESR_HPP

#include "acdc/crypto/Digest.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace acdc::crypto
{

constexpr std::size_t g_saltBytes{ 16U };
constexpr std::string_view g_saltCode{ "0A" };
constexpr std::size_t g_saltChars{ 24U };

using Salt128 = std::array<std::uint8_t, g_saltBytes>;

// Fully qualified textual SAID: code character followed by the URL-safe base64 digest.
[[nodiscard]] std::string encodeSaid(DigestCode code, const Digest256& digest);

// Code of a textual SAID, or std::nullopt when the leading character is not a known digest code.
[[nodiscard]] std::optional<DigestCode> saidCode(std::string_view said) noexcept;

// Known code, exact length and URL-safe base64 alphabet.
[[nodiscard]] bool isWellFormedSaid(std::string_view said) noexcept;

[[nodiscard]] std::string encodeSalt(const Salt128& salt);

[[nodiscard]] std::string placeholderFor(DigestCode code);

} // namespace acdc::crypto

#endif // INCLUDE_ACDC_CRYPTO_CESR_HPP
