#include "acdc/resolver/memory/InMemoryContainerStoreFactory.hpp"

#include "acdc/core/Container.hpp"
#include "acdc/core/Said.hpp"
#include <functional>
#include <map>
#include <mutex>
#include <shared_mutex>
#include <utility>

namespace acdc::resolver::memory
{
namespace
{

class InMemoryContainerStore final : public acdc::resolver::IContainerStore
{
public:
    [[nodiscard]] std::optional<acdc::core::Bytes> resolve(std::string_view identifier) const override
    {
        std::shared_lock lock{ m_mutex };
        const auto it{ m_entries.find(identifier) };
        if (it == m_entries.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    [[nodiscard]] acdc::core::AcdcResult<std::string> put(std::span<const std::uint8_t> bytes) override
    {
        if (const auto verified{ acdc::core::verifyIdentifier(bytes) }; acdc::core::isError(verified))
        {
            return acdc::core::errorOf(verified);
        }
        auto container{ acdc::core::Container::decode(bytes) };
        if (acdc::core::isError(container))
        {
            return acdc::core::errorOf(container);
        }

        std::string identifier{ std::get<acdc::core::Container>(container).identifier() };
        std::unique_lock lock{ m_mutex };
        m_entries.insert_or_assign(identifier, acdc::core::Bytes(bytes.begin(), bytes.end()));
        return identifier;
    }

    [[nodiscard]] std::vector<std::string> listIdentifiers() const override
    {
        std::shared_lock lock{ m_mutex };
        std::vector<std::string> out{};
        out.reserve(m_entries.size());
        for (const auto& entry : m_entries)
        {
            out.push_back(entry.first);
        }
        return out;
    }

    [[nodiscard]] bool remove(std::string_view identifier) override
    {
        std::unique_lock lock{ m_mutex };
        const auto it{ m_entries.find(identifier) };
        if (it == m_entries.end())
        {
            return false;
        }
        m_entries.erase(it);
        return true;
    }

private:
    mutable std::shared_mutex m_mutex;
    std::map<std::string, acdc::core::Bytes, std::less<>> m_entries;
};

} // namespace

[[nodiscard]] std::unique_ptr<acdc::resolver::IContainerStore> makeInMemoryContainerStore()
{
    return std::make_unique<InMemoryContainerStore>();
}

} // namespace acdc::resolver::memory
