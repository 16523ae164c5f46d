#ifndef INCLUDE_ACDC_RESOLVER_ICONTAINERRESOLVER_HPP
#define INCLUDE_ACDC_RESOLVER_ICONTAINERRESOLVER_HPP

#include "acdc/core/AcdcError.hpp"
#include "acdc/core/Serialization.hpp"
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace acdc::resolver
{

class IContainerResolver
{
public:
    IContainerResolver() = default;
    IContainerResolver(const IContainerResolver&) = delete;
    IContainerResolver& operator=(const IContainerResolver&) = delete;
    IContainerResolver(IContainerResolver&&) = delete;
    IContainerResolver& operator=(IContainerResolver&&) = delete;
    virtual ~IContainerResolver() = default;

    // Encoded container stored under `identifier`, or std::nullopt when it is unknown or
    // the backend cannot produce it.
    [[nodiscard]] virtual std::optional<acdc::core::Bytes> resolve(std::string_view identifier) const = 0;
};

class IContainerStore : public IContainerResolver
{
public:
    // Verifies `bytes` and stores them under their own identifier, which is returned.
    // Replaces an existing entry with the same identifier.
    [[nodiscard]] virtual acdc::core::AcdcResult<std::string> put(std::span<const std::uint8_t> bytes) = 0;

    [[nodiscard]] virtual std::vector<std::string> listIdentifiers() const = 0;

    // Returns true if an entry was deleted, false if it was not found.
    [[nodiscard]] virtual bool remove(std::string_view identifier) = 0;
};

} // namespace acdc::resolver

#endif // INCLUDE_ACDC_RESOLVER_ICONTAINERRESOLVER_HPP
