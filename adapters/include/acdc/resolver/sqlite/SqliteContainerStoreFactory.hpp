#ifndef INCLUDE_ACDC_RESOLVER_SQLITE_SQLITECONTAINERSTOREFACTORY_HPP
#define INCLUDE_ACDC_RESOLVER_SQLITE_SQLITECONTAINERSTOREFACTORY_HPP

#include "acdc/resolver/IContainerResolver.hpp"
#include <filesystem>
#include <memory>

namespace acdc::resolver::sqlite
{

// Opens (creating when missing) the database file at `dbPath`.
// Throws std::runtime_error if the database cannot be opened or initialized.
[[nodiscard]] std::unique_ptr<acdc::resolver::IContainerStore> makeSqliteContainerStore(const std::filesystem::path& dbPath);

} // namespace acdc::resolver::sqlite

#endif // INCLUDE_ACDC_RESOLVER_SQLITE_SQLITECONTAINERSTOREFACTORY_HPP
