#ifndef INCLUDE_ACDC_CORE_ACDCERROR_HPP
#define INCLUDE_ACDC_CORE_ACDCERROR_HPP

#include <cstdint>
#include <string_view>
#include <variant>

namespace acdc::core
{

enum class AcdcError : std::uint8_t
{
    MalformedHeader,
    UnsupportedKind,
    ParseError,
    SizeMismatch,
    UnknownAlgorithm,
    DigestMismatch,
    InvalidField,
    CompactOnly,
    ExpansionMismatch,
    CycleDetected,
    NotFound,
    SchemaConstraintFailed,
    OperatorUnsatisfied,
    HeaderSizeOverflow,
};

template <class T> using AcdcResult = std::variant<T, AcdcError>;

[[nodiscard]] constexpr std::string_view toString(AcdcError error) noexcept
{
    switch (error)
    {
    case AcdcError::MalformedHeader:
        return "malformed_header";
    case AcdcError::UnsupportedKind:
        return "unsupported_kind";
    case AcdcError::ParseError:
        return "parse_error";
    case AcdcError::SizeMismatch:
        return "size_mismatch";
    case AcdcError::UnknownAlgorithm:
        return "unknown_algorithm";
    case AcdcError::DigestMismatch:
        return "digest_mismatch";
    case AcdcError::InvalidField:
        return "invalid_field";
    case AcdcError::CompactOnly:
        return "compact_only";
    case AcdcError::ExpansionMismatch:
        return "expansion_mismatch";
    case AcdcError::CycleDetected:
        return "cycle_detected";
    case AcdcError::NotFound:
        return "not_found";
    case AcdcError::SchemaConstraintFailed:
        return "schema_constraint_failed";
    case AcdcError::OperatorUnsatisfied:
        return "operator_unsatisfied";
    case AcdcError::HeaderSizeOverflow:
        return "header_size_overflow";
    }
    return "unknown";
}

template <class T> [[nodiscard]] bool isError(const AcdcResult<T>& result) noexcept
{
    return std::holds_alternative<AcdcError>(result);
}

template <class T> [[nodiscard]] AcdcError errorOf(const AcdcResult<T>& result) noexcept
{
    return std::get<AcdcError>(result);
}

} // namespace acdc::core

#endif // INCLUDE_ACDC_CORE_ACDCERROR_HPP
