#ifndef INCLUDE_ACDC_CORE_SERIALIZATION_HPP
#define INCLUDE_ACDC_CORE_SERIALIZATION_HPP

#include "acdc/core/AcdcError.hpp"
#include "acdc/core/VersionHeader.hpp"
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <span>
#include <vector>

namespace acdc::core
{

// Insertion-ordered document model shared by all three serialization kinds.
using Document = nlohmann::ordered_json;
using Bytes = std::vector<std::uint8_t>;

// Machine-canonical encoding: no whitespace, mapping order exactly as inserted.
// Returns InvalidField for content the target kind cannot represent (e.g. invalid UTF-8 in JSON).
[[nodiscard]] AcdcResult<Bytes> serialize(SerializationKind kind, const Document& doc);

// Returns ParseError when the bytes are not one complete document of the given kind.
[[nodiscard]] AcdcResult<Document> deserialize(SerializationKind kind, std::span<const std::uint8_t> bytes);

// Physical encoding of a serialized top-level mapping, judged from its first byte.
[[nodiscard]] std::optional<SerializationKind> detectKind(std::span<const std::uint8_t> bytes) noexcept;

[[nodiscard]] inline std::span<const std::uint8_t> asByteSpan(std::string_view text) noexcept
{
    return { reinterpret_cast<const std::uint8_t*>(text.data()), text.size() };
}

} // namespace acdc::core

#endif // INCLUDE_ACDC_CORE_SERIALIZATION_HPP
