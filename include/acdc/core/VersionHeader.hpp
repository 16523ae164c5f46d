#ifndef INCLUDE_ACDC_CORE_VERSIONHEADER_HPP
#define INCLUDE_ACDC_CORE_VERSIONHEADER_HPP

#include "acdc/core/AcdcError.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace acdc::core
{

enum class SerializationKind : std::uint8_t
{
    Json,
    Cbor,
    MsgPack,
};

constexpr std::string_view g_protocolTag{ "ACDC" };
constexpr std::uint8_t g_protocolMajorVersion{ 1U };
constexpr std::uint8_t g_protocolMinorVersion{ 0U };

constexpr std::size_t g_kindCodeChars{ 4U };
constexpr std::size_t g_sizeHexChars{ 6U };
constexpr char g_versionTerminator{ '_' };

// "ACDC" + major + minor + kind + size + "_"
constexpr std::size_t g_versionHeaderChars{ 4U + 1U + 1U + g_kindCodeChars + g_sizeHexChars + 1U };
constexpr std::uint32_t g_maxContainerBytes{ 0xFFFFFFU };

struct VersionHeader final
{
    std::uint8_t majorVersion{ g_protocolMajorVersion };
    std::uint8_t minorVersion{ g_protocolMinorVersion };
    SerializationKind kind{ SerializationKind::Json };
    std::uint32_t totalByteSize{ 0U };

    friend bool operator==(const VersionHeader&, const VersionHeader&) = default;
};

[[nodiscard]] std::string_view kindCode(SerializationKind kind) noexcept;

[[nodiscard]] std::optional<SerializationKind> kindFromCode(std::string_view code) noexcept;

// Fails with HeaderSizeOverflow when totalByteSize does not fit the fixed-width size field.
[[nodiscard]] AcdcResult<std::string> encodeVersionHeader(const VersionHeader& header);

// Structural decode only; the declared size is not compared against any buffer here.
[[nodiscard]] AcdcResult<VersionHeader> decodeVersionHeader(std::string_view text);

} // namespace acdc::core

#endif // INCLUDE_ACDC_CORE_VERSIONHEADER_HPP
