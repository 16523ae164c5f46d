#ifndef INCLUDE_ACDC_SECURITY_SECURERANDOM_HPP
#define INCLUDE_ACDC_SECURITY_SECURERANDOM_HPP

#include "acdc/crypto/Cesr.hpp"
#include <cstdint>
#include <span>

namespace acdc::security
{

// Fills `out` from the OS CSPRNG; false when the source fails or returns short.
[[nodiscard]] bool secureRandomFill(std::span<std::uint8_t> out) noexcept;

// Throws std::runtime_error when no entropy is available.
[[nodiscard]] acdc::crypto::Salt128 secureRandomSalt();

} // namespace acdc::security

#endif // INCLUDE_ACDC_SECURITY_SECURERANDOM_HPP
