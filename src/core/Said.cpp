#include "acdc/core/Said.hpp"

#include "acdc/crypto/Cesr.hpp"
#include <algorithm>
#include <array>
#include <cstddef>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string_view>

namespace acdc::core
{
namespace
{

[[nodiscard]] std::optional<std::size_t> findTextSpan(std::span<const std::uint8_t> bytes, std::string_view text)
{
    const auto it{ std::search(bytes.begin(), bytes.end(), text.begin(), text.end(),
                               [](std::uint8_t b, char c) { return b == static_cast<std::uint8_t>(c); }) };
    if (it == bytes.end())
    {
        return std::nullopt;
    }
    return static_cast<std::size_t>(std::distance(bytes.begin(), it));
}

void overwriteSpan(Bytes& bytes, std::size_t offset, std::string_view text)
{
    std::transform(text.begin(), text.end(), bytes.begin() + static_cast<std::ptrdiff_t>(offset),
                   [](char c) { return static_cast<std::uint8_t>(c); });
}

// Leading bytes in front of the version string: `{"v":"` for JSON; for CBOR and MessagePack the
// map header, the one-character key "v" and a 17-character string header.
constexpr std::string_view g_kJsonVersionPrefix{ R"({"v":")" };
constexpr std::array<std::uint8_t, 3> g_kCborVersionKey{ 0x61U, 'v', 0x71U };
constexpr std::array<std::uint8_t, 3> g_kMsgPackVersionKey{ 0xA1U, 'v', 0xB1U };
constexpr std::uint8_t g_kCborAdditionalInfoMask{ 0x1FU };

[[nodiscard]] std::optional<std::size_t> cborMapHeaderBytes(std::uint8_t first) noexcept
{
    const std::uint8_t info{ static_cast<std::uint8_t>(first & g_kCborAdditionalInfoMask) };
    if (info < 24U || info == 31U)
    {
        return 1U;
    }
    switch (info)
    {
    case 24U:
        return 2U;
    case 25U:
        return 3U;
    case 26U:
        return 5U;
    case 27U:
        return 9U;
    default:
        return std::nullopt;
    }
}

[[nodiscard]] std::size_t msgPackMapHeaderBytes(std::uint8_t first) noexcept
{
    switch (first)
    {
    case 0xDEU:
        return 3U;
    case 0xDFU:
        return 5U;
    default:
        return 1U;
    }
}

[[nodiscard]] bool matchesAt(std::span<const std::uint8_t> bytes, std::size_t offset,
                             std::span<const std::uint8_t> expected) noexcept
{
    return bytes.size() >= offset + expected.size() &&
           std::equal(expected.begin(), expected.end(), bytes.begin() + static_cast<std::ptrdiff_t>(offset));
}

// Version string read from its fixed position, without deserializing the body.
[[nodiscard]] std::optional<std::string_view> versionTextOf(SerializationKind kind,
                                                            std::span<const std::uint8_t> bytes) noexcept
{
    std::optional<std::size_t> offset{};
    switch (kind)
    {
    case SerializationKind::Json:
        if (matchesAt(bytes, 0U, asByteSpan(g_kJsonVersionPrefix)))
        {
            offset = g_kJsonVersionPrefix.size();
        }
        break;
    case SerializationKind::Cbor:
        if (const auto header{ cborMapHeaderBytes(bytes.front()) };
            header.has_value() && matchesAt(bytes, *header, g_kCborVersionKey))
        {
            offset = *header + g_kCborVersionKey.size();
        }
        break;
    case SerializationKind::MsgPack:
        if (const auto header{ msgPackMapHeaderBytes(bytes.front()) }; matchesAt(bytes, header, g_kMsgPackVersionKey))
        {
            offset = header + g_kMsgPackVersionKey.size();
        }
        break;
    }

    if (!offset || bytes.size() < *offset + g_versionHeaderChars)
    {
        return std::nullopt;
    }
    return std::string_view{ reinterpret_cast<const char*>(bytes.data() + *offset), g_versionHeaderChars };
}

[[nodiscard]] Document withLeadingFields(const Document& doc, const std::string& version, const std::string& said)
{
    Document out = Document::object();
    out[g_versionLabel] = version;
    out[g_identifierLabel] = said;
    for (const auto& [key, value] : doc.items())
    {
        if (key != g_versionLabel && key != g_identifierLabel)
        {
            out[key] = value;
        }
    }
    return out;
}

} // namespace

[[nodiscard]] AcdcResult<FinalizedBytes> computeIdentifier(const Document& doc, SerializationKind kind,
                                                           acdc::crypto::DigestCode code)
{
    if (!doc.is_object())
    {
        return AcdcError::InvalidField;
    }

    const std::string placeholder{ acdc::crypto::placeholderFor(code) };
    VersionHeader header{ .kind = kind, .totalByteSize = 0U };

    auto versionRes{ encodeVersionHeader(header) };
    if (isError(versionRes))
    {
        return errorOf(versionRes);
    }
    Document work = withLeadingFields(doc, std::get<std::string>(versionRes), placeholder);

    auto sizingRes{ serialize(kind, work) };
    if (isError(sizingRes))
    {
        return errorOf(sizingRes);
    }
    const std::size_t byteLength{ std::get<Bytes>(sizingRes).size() };
    if (byteLength > g_maxContainerBytes)
    {
        return AcdcError::HeaderSizeOverflow;
    }

    header.totalByteSize = static_cast<std::uint32_t>(byteLength);
    versionRes = encodeVersionHeader(header);
    if (isError(versionRes))
    {
        return errorOf(versionRes);
    }
    work[g_versionLabel] = std::get<std::string>(versionRes);

    auto finalRes{ serialize(kind, work) };
    if (isError(finalRes))
    {
        return errorOf(finalRes);
    }
    Bytes bytes{ std::move(std::get<Bytes>(finalRes)) };
    if (bytes.size() != byteLength)
    {
        throw std::logic_error("computeIdentifier: size field changed the serialized length");
    }

    std::string said{ acdc::crypto::encodeSaid(code, acdc::crypto::computeDigest(code, bytes)) };
    if (said.size() != placeholder.size())
    {
        throw std::logic_error("computeIdentifier: encoded digest does not match placeholder length");
    }

    // `v` precedes `d` and cannot contain the placeholder, so the first match is the identifier span.
    const auto offset{ findTextSpan(bytes, placeholder) };
    if (!offset)
    {
        throw std::logic_error("computeIdentifier: placeholder not found in serialized container");
    }
    overwriteSpan(bytes, *offset, said);

    return FinalizedBytes{
        .bytes = std::move(bytes),
        .identifier = std::move(said),
        .header = header,
    };
}

[[nodiscard]] AcdcResult<std::monostate> verifyIdentifier(std::span<const std::uint8_t> bytes)
{
    const auto kind{ detectKind(bytes) };
    if (!kind)
    {
        return AcdcError::UnsupportedKind;
    }

    const auto versionText{ versionTextOf(*kind, bytes) };
    if (!versionText)
    {
        return AcdcError::MalformedHeader;
    }
    const auto headerRes{ decodeVersionHeader(*versionText) };
    if (isError(headerRes))
    {
        return errorOf(headerRes);
    }
    const auto& header{ std::get<VersionHeader>(headerRes) };
    if (header.kind != *kind)
    {
        return AcdcError::UnsupportedKind;
    }
    if (header.totalByteSize != bytes.size())
    {
        return AcdcError::SizeMismatch;
    }

    const auto docRes{ deserialize(*kind, bytes) };
    if (isError(docRes))
    {
        return errorOf(docRes);
    }
    const auto& doc{ std::get<Document>(docRes) };
    if (!doc.is_object() || doc.size() < 2U)
    {
        return AcdcError::ParseError;
    }

    auto it{ doc.begin() };
    if (it.key() != g_versionLabel || !it.value().is_string() ||
        it.value().get_ref<const std::string&>() != *versionText)
    {
        return AcdcError::MalformedHeader;
    }

    ++it;
    if (it.key() != g_identifierLabel || !it.value().is_string())
    {
        return AcdcError::ParseError;
    }
    const auto& said{ it.value().get_ref<const std::string&>() };
    const auto code{ acdc::crypto::saidCode(said) };
    if (!code)
    {
        return AcdcError::UnknownAlgorithm;
    }
    if (said.size() != acdc::crypto::saidLength(*code))
    {
        return AcdcError::DigestMismatch;
    }

    const auto offset{ findTextSpan(bytes, said) };
    if (!offset)
    {
        return AcdcError::DigestMismatch;
    }

    Bytes work(bytes.begin(), bytes.end());
    overwriteSpan(work, *offset, acdc::crypto::placeholderFor(*code));

    const std::string recomputed{ acdc::crypto::encodeSaid(*code, acdc::crypto::computeDigest(*code, work)) };
    if (recomputed != said)
    {
        return AcdcError::DigestMismatch;
    }
    return std::monostate{};
}

[[nodiscard]] AcdcResult<std::string> computeBlockSaid(const Document& block, SerializationKind kind,
                                                       acdc::crypto::DigestCode code)
{
    if (!block.is_object())
    {
        return AcdcError::InvalidField;
    }

    Document work = block;
    if (work.contains(g_identifierLabel))
    {
        work[g_identifierLabel] = acdc::crypto::placeholderFor(code);
    }

    const auto bytesRes{ serialize(kind, work) };
    if (isError(bytesRes))
    {
        return errorOf(bytesRes);
    }
    return acdc::crypto::encodeSaid(code, acdc::crypto::computeDigest(code, std::get<Bytes>(bytesRes)));
}

[[nodiscard]] AcdcResult<Document> saidifyBlock(const Document& block, SerializationKind kind,
                                                acdc::crypto::DigestCode code)
{
    if (!block.is_object())
    {
        return AcdcError::InvalidField;
    }

    Document work = block;
    if (!work.contains(g_identifierLabel))
    {
        work = Document::object();
        work[g_identifierLabel] = acdc::crypto::placeholderFor(code);
        for (const auto& [key, value] : block.items())
        {
            work[key] = value;
        }
    }

    const auto saidRes{ computeBlockSaid(work, kind, code) };
    if (isError(saidRes))
    {
        return errorOf(saidRes);
    }
    work[g_identifierLabel] = std::get<std::string>(saidRes);
    return work;
}

[[nodiscard]] bool blockMatchesSaid(const Document& block, SerializationKind kind, std::string_view said)
{
    const auto code{ acdc::crypto::saidCode(said) };
    if (!code)
    {
        return false;
    }
    if (block.is_object() && block.contains(g_identifierLabel))
    {
        const auto& embedded{ block[g_identifierLabel] };
        if (!embedded.is_string() || embedded.get_ref<const std::string&>() != said)
        {
            return false;
        }
    }

    const auto computed{ computeBlockSaid(block, kind, *code) };
    return !isError(computed) && std::get<std::string>(computed) == said;
}

} // namespace acdc::core
