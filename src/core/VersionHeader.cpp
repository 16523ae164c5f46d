#include "acdc/core/VersionHeader.hpp"

#include <array>
#include <cstddef>
#include <cstdint>

namespace acdc::core
{
namespace
{

constexpr std::size_t g_kMajorOffset{ g_protocolTag.size() };
constexpr std::size_t g_kMinorOffset{ g_kMajorOffset + 1U };
constexpr std::size_t g_kKindOffset{ g_kMinorOffset + 1U };
constexpr std::size_t g_kSizeOffset{ g_kKindOffset + g_kindCodeChars };
constexpr std::size_t g_kTerminatorOffset{ g_kSizeOffset + g_sizeHexChars };

constexpr std::uint8_t g_kMaxHexDigit{ 0x0FU };
constexpr std::uint32_t g_kNibbleBits{ 4U };
constexpr char g_kHexDigits[] = "0123456789abcdef";

[[nodiscard]] std::optional<std::uint8_t> hexNibble(char c) noexcept
{
    if (c >= '0' && c <= '9')
    {
        return static_cast<std::uint8_t>(c - '0');
    }
    if (c >= 'a' && c <= 'f')
    {
        return static_cast<std::uint8_t>(c - 'a' + 10);
    }
    return std::nullopt;
}

} // namespace

[[nodiscard]] std::string_view kindCode(SerializationKind kind) noexcept
{
    switch (kind)
    {
    case SerializationKind::Json:
        return "JSON";
    case SerializationKind::Cbor:
        return "CBOR";
    case SerializationKind::MsgPack:
        return "MGPK";
    }
    return "JSON";
}

[[nodiscard]] std::optional<SerializationKind> kindFromCode(std::string_view code) noexcept
{
    constexpr std::array<SerializationKind, 3> kKinds{ SerializationKind::Json, SerializationKind::Cbor,
                                                       SerializationKind::MsgPack };
    for (const auto kind : kKinds)
    {
        if (kindCode(kind) == code)
        {
            return kind;
        }
    }
    return std::nullopt;
}

[[nodiscard]] AcdcResult<std::string> encodeVersionHeader(const VersionHeader& header)
{
    if (header.totalByteSize > g_maxContainerBytes)
    {
        return AcdcError::HeaderSizeOverflow;
    }
    if (header.majorVersion > g_kMaxHexDigit || header.minorVersion > g_kMaxHexDigit)
    {
        return AcdcError::MalformedHeader;
    }

    std::string out{ g_protocolTag };
    out.reserve(g_versionHeaderChars);
    out.push_back(g_kHexDigits[header.majorVersion]);
    out.push_back(g_kHexDigits[header.minorVersion]);
    out.append(kindCode(header.kind));

    for (std::size_t i{ g_sizeHexChars }; i > 0U; --i)
    {
        const std::uint32_t shift{ static_cast<std::uint32_t>(i - 1U) * g_kNibbleBits };
        out.push_back(g_kHexDigits[(header.totalByteSize >> shift) & g_kMaxHexDigit]);
    }
    out.push_back(g_versionTerminator);
    return out;
}

[[nodiscard]] AcdcResult<VersionHeader> decodeVersionHeader(std::string_view text)
{
    if (text.size() != g_versionHeaderChars)
    {
        return AcdcError::MalformedHeader;
    }
    if (text.substr(0U, g_protocolTag.size()) != g_protocolTag)
    {
        return AcdcError::MalformedHeader;
    }
    if (text[g_kTerminatorOffset] != g_versionTerminator)
    {
        return AcdcError::MalformedHeader;
    }

    const auto major{ hexNibble(text[g_kMajorOffset]) };
    const auto minor{ hexNibble(text[g_kMinorOffset]) };
    if (!major || !minor)
    {
        return AcdcError::MalformedHeader;
    }

    const auto kind{ kindFromCode(text.substr(g_kKindOffset, g_kindCodeChars)) };
    if (!kind)
    {
        return AcdcError::MalformedHeader;
    }

    std::uint32_t size{ 0U };
    for (const char c : text.substr(g_kSizeOffset, g_sizeHexChars))
    {
        const auto nibble{ hexNibble(c) };
        if (!nibble)
        {
            return AcdcError::MalformedHeader;
        }
        size = (size << g_kNibbleBits) | *nibble;
    }

    return VersionHeader{
        .majorVersion = *major,
        .minorVersion = *minor,
        .kind = *kind,
        .totalByteSize = size,
    };
}

} // namespace acdc::core
