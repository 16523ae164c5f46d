#include "acdc/core/Serialization.hpp"

#include <string>

namespace acdc::core
{
namespace
{

constexpr std::uint8_t g_kJsonObjectOpen{ '{' };
constexpr std::uint8_t g_kCborMajorTypeMask{ 0xE0U };
constexpr std::uint8_t g_kCborMapMajorType{ 0xA0U };
constexpr std::uint8_t g_kMsgPackFixMapMask{ 0xF0U };
constexpr std::uint8_t g_kMsgPackFixMap{ 0x80U };
constexpr std::uint8_t g_kMsgPackMap16{ 0xDEU };
constexpr std::uint8_t g_kMsgPackMap32{ 0xDFU };

} // namespace

[[nodiscard]] AcdcResult<Bytes> serialize(SerializationKind kind, const Document& doc)
{
    switch (kind)
    {
    case SerializationKind::Json:
    {
        std::string text{};
        try
        {
            text = doc.dump();
        }
        catch (const Document::type_error&)
        {
            return AcdcError::InvalidField;
        }
        return Bytes(text.begin(), text.end());
    }
    case SerializationKind::Cbor:
        return Document::to_cbor(doc);
    case SerializationKind::MsgPack:
        return Document::to_msgpack(doc);
    }
    return AcdcError::UnsupportedKind;
}

[[nodiscard]] AcdcResult<Document> deserialize(SerializationKind kind, std::span<const std::uint8_t> bytes)
{
    Document doc{};
    switch (kind)
    {
    case SerializationKind::Json:
        doc = Document::parse(bytes.begin(), bytes.end(), nullptr, false);
        break;
    case SerializationKind::Cbor:
        doc = Document::from_cbor(bytes.begin(), bytes.end(), true, false);
        break;
    case SerializationKind::MsgPack:
        doc = Document::from_msgpack(bytes.begin(), bytes.end(), true, false);
        break;
    }

    if (doc.is_discarded())
    {
        return AcdcError::ParseError;
    }
    return doc;
}

[[nodiscard]] std::optional<SerializationKind> detectKind(std::span<const std::uint8_t> bytes) noexcept
{
    if (bytes.empty())
    {
        return std::nullopt;
    }

    const std::uint8_t first{ bytes.front() };
    if (first == g_kJsonObjectOpen)
    {
        return SerializationKind::Json;
    }
    if ((first & g_kCborMajorTypeMask) == g_kCborMapMajorType)
    {
        return SerializationKind::Cbor;
    }
    if ((first & g_kMsgPackFixMapMask) == g_kMsgPackFixMap || first == g_kMsgPackMap16 || first == g_kMsgPackMap32)
    {
        return SerializationKind::MsgPack;
    }
    return std::nullopt;
}

} // namespace acdc::core
