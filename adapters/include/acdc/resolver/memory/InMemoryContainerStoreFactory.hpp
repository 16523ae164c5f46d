#ifndef INCLUDE_ACDC_RESOLVER_MEMORY_INMEMORYCONTAINERSTOREFACTORY_HPP
#define INCLUDE_ACDC_RESOLVER_MEMORY_INMEMORYCONTAINERSTOREFACTORY_HPP

#include "acdc/resolver/IContainerResolver.hpp"
#include <memory>

namespace acdc::resolver::memory
{

[[nodiscard]] std::unique_ptr<acdc::resolver::IContainerStore> makeInMemoryContainerStore();

} // namespace acdc::resolver::memory

#endif // INCLUDE_ACDC_RESOLVER_MEMORY_INMEMORYCONTAINERSTOREFACTORY_HPP
