#include "acdc/security/SecureRandom.hpp"
#include <cerrno>
#include <cstddef>
#include <stdexcept>

#if defined(__linux__)
#include <sys/random.h>
#else
#error Unsupported platform
#endif

namespace acdc::security
{

bool secureRandomFill(std::span<std::uint8_t> out) noexcept
{
    std::uint8_t* outPtr{ out.data() };
    std::size_t remaining{ out.size() };
    while (remaining > 0U)
    {
        const ssize_t bytesReceived{ ::getrandom(outPtr, remaining, 0) };

        if (bytesReceived > 0)
        {
            const std::size_t received{ static_cast<std::size_t>(bytesReceived) };
            if (received > remaining)
            {
                return false;
            }
            remaining -= received;
            outPtr += received;
            continue;
        }

        if (bytesReceived < 0 && errno == EINTR)
        {
            continue;
        }
        return false;
    }
    return true;
}

acdc::crypto::Salt128 secureRandomSalt()
{
    acdc::crypto::Salt128 salt{};
    if (!secureRandomFill(std::span{ salt }))
    {
        throw std::runtime_error("secureRandomSalt: getrandom failed");
    }
    return salt;
}

} // namespace acdc::security
