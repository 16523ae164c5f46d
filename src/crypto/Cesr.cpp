#include "acdc/crypto/Cesr.hpp"

#include <algorithm>
#include <openssl/evp.h>
#include <span>
#include <stdexcept>

namespace acdc::crypto
{
namespace
{

constexpr char g_kPlaceholderChar{ '#' };

// Input length must be a multiple of three: CESR pads raw material with leading zero bytes instead of '='.
[[nodiscard]] std::string base64UrlNoPad(std::span<const std::uint8_t> raw)
{
    std::string out((raw.size() / 3U) * 4U + 1U, '\0');
    const int written{ EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()), raw.data(),
                                       static_cast<int>(raw.size())) };
    if (written < 0)
    {
        throw std::runtime_error("base64UrlNoPad: EVP_EncodeBlock failed");
    }
    out.resize(static_cast<std::size_t>(written));
    std::replace(out.begin(), out.end(), '+', '-');
    std::replace(out.begin(), out.end(), '/', '_');
    return out;
}

[[nodiscard]] bool isBase64UrlChar(char c) noexcept
{
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' || c == '_';
}

} // namespace

[[nodiscard]] std::string encodeSaid(DigestCode code, const Digest256& digest)
{
    std::array<std::uint8_t, g_digestBytes + 1U> padded{};
    for (std::size_t i{}; i < digest.size(); ++i)
    {
        padded[i + 1U] = digest[i];
    }

    std::string out{ base64UrlNoPad(padded) };
    out[0] = digestCodeChar(code);
    return out;
}

[[nodiscard]] std::optional<DigestCode> saidCode(std::string_view said) noexcept
{
    if (said.empty())
    {
        return std::nullopt;
    }
    return digestCodeFromChar(said.front());
}

[[nodiscard]] bool isWellFormedSaid(std::string_view said) noexcept
{
    const auto code{ saidCode(said) };
    if (!code || said.size() != saidLength(*code))
    {
        return false;
    }
    for (const char c : said.substr(1U))
    {
        if (!isBase64UrlChar(c))
        {
            return false;
        }
    }
    return true;
}

[[nodiscard]] std::string encodeSalt(const Salt128& salt)
{
    std::array<std::uint8_t, g_saltBytes + 2U> padded{};
    for (std::size_t i{}; i < salt.size(); ++i)
    {
        padded[i + 2U] = salt[i];
    }

    std::string out{ base64UrlNoPad(padded) };
    out.replace(0U, g_saltCode.size(), g_saltCode);
    return out;
}

[[nodiscard]] std::string placeholderFor(DigestCode code)
{
    return std::string(saidLength(code), g_kPlaceholderChar);
}

} // namespace acdc::crypto
