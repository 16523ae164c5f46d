#include "acdc/resolver/sqlite/SqliteContainerStoreFactory.hpp"

#include "acdc/core/Container.hpp"
#include "acdc/core/Said.hpp"
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <memory>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <sqlite3.h>

namespace acdc::resolver::sqlite
{
namespace
{

struct SqliteDbDeleter final
{
    void operator()(sqlite3* db) const noexcept
    {
        if (db != nullptr)
        {
            (void)sqlite3_close_v2(db);
        }
    }
};

struct SqliteStmtDeleter final
{
    void operator()(sqlite3_stmt* stmt) const noexcept
    {
        if (stmt != nullptr)
        {
            (void)sqlite3_finalize(stmt);
        }
    }
};

using SqliteDbPtr = std::unique_ptr<sqlite3, SqliteDbDeleter>;
using SqliteStmtPtr = std::unique_ptr<sqlite3_stmt, SqliteStmtDeleter>;

[[nodiscard]] std::string sqliteErr(sqlite3* db, const char* prefix)
{
    const char* msg = (db != nullptr) ? sqlite3_errmsg(db) : "no-db";
    std::string out{ prefix };
    out.append(": ");
    out.append(msg);
    return out;
}

void exec(sqlite3* db, const char* sql)
{
    char* errMsg = nullptr;
    const int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK)
    {
        std::string msg = sqliteErr(db, "resolver: sqlite3_exec failed");
        if (errMsg != nullptr)
        {
            msg.append(" (");
            msg.append(errMsg);
            msg.append(")");
            sqlite3_free(errMsg);
        }
        throw std::runtime_error(msg);
    }
}

[[nodiscard]] SqliteDbPtr openDb(const std::filesystem::path& path, int flags)
{
    sqlite3* raw = nullptr;
    const std::string filename = path.string();
    const int rc = sqlite3_open_v2(filename.c_str(), &raw, flags, nullptr);
    SqliteDbPtr db{ raw };
    if (rc != SQLITE_OK || !db)
    {
        throw std::runtime_error(sqliteErr(raw, "resolver: sqlite3_open_v2 failed"));
    }
    return db;
}

[[nodiscard]] SqliteStmtPtr prepare(sqlite3* db, const char* sql)
{
    sqlite3_stmt* rawStmt = nullptr;
    const int prepRc = sqlite3_prepare_v2(db, sql, -1, &rawStmt, nullptr);
    SqliteStmtPtr stmt{ rawStmt };
    if (prepRc != SQLITE_OK || !stmt)
    {
        throw std::runtime_error(sqliteErr(db, "resolver: sqlite3_prepare_v2 failed"));
    }
    return stmt;
}

void bindText(sqlite3* db, sqlite3_stmt* stmt, int index, std::string_view text)
{
    if (sqlite3_bind_text(stmt, index, text.data(), static_cast<int>(text.size()), SQLITE_STATIC) != SQLITE_OK)
    {
        throw std::runtime_error(sqliteErr(db, "resolver: bind said failed"));
    }
}

void ensureSchema(sqlite3* db)
{
    exec(db, "CREATE TABLE IF NOT EXISTS containers ("
             " said TEXT PRIMARY KEY,"
             " body BLOB NOT NULL"
             ");");
}

void upsertContainer(sqlite3* db, std::string_view said, std::span<const std::uint8_t> body)
{
    const char* sql = "INSERT INTO containers(said, body) VALUES (?, ?)"
                      " ON CONFLICT(said) DO UPDATE SET body=excluded.body;";
    auto stmt = prepare(db, sql);

    bindText(db, stmt.get(), 1, said);
    if (sqlite3_bind_blob(stmt.get(), 2, body.data(), static_cast<int>(body.size()), SQLITE_STATIC) != SQLITE_OK)
    {
        throw std::runtime_error(sqliteErr(db, "resolver: bind body failed"));
    }

    if (sqlite3_step(stmt.get()) != SQLITE_DONE)
    {
        throw std::runtime_error(sqliteErr(db, "resolver: upsert container failed"));
    }
}

[[nodiscard]] std::optional<acdc::core::Bytes> loadContainer(sqlite3* db, std::string_view said)
{
    auto stmt = prepare(db, "SELECT body FROM containers WHERE said = ?;");
    bindText(db, stmt.get(), 1, said);

    const int stepRc = sqlite3_step(stmt.get());
    if (stepRc == SQLITE_DONE)
    {
        return std::nullopt;
    }
    if (stepRc != SQLITE_ROW)
    {
        throw std::runtime_error(sqliteErr(db, "resolver: select container failed"));
    }

    const void* bodyPtr = sqlite3_column_blob(stmt.get(), 0);
    const int bodyBytes = sqlite3_column_bytes(stmt.get(), 0);
    if (bodyBytes < 0 || (bodyBytes > 0 && bodyPtr == nullptr))
    {
        throw std::runtime_error("resolver: invalid containers row");
    }

    acdc::core::Bytes out(static_cast<std::size_t>(bodyBytes));
    if (bodyBytes > 0)
    {
        std::memcpy(out.data(), bodyPtr, static_cast<std::size_t>(bodyBytes));
    }
    return out;
}

class SqliteContainerStore final : public acdc::resolver::IContainerStore
{
public:
    explicit SqliteContainerStore(SqliteDbPtr db) noexcept : m_db(std::move(db))
    {
    }

    // Backend failures surface as an unresolved identifier.
    [[nodiscard]] std::optional<acdc::core::Bytes> resolve(std::string_view identifier) const override
    {
        try
        {
            return loadContainer(m_db.get(), identifier);
        }
        catch (const std::runtime_error&)
        {
            return std::nullopt;
        }
    }

    [[nodiscard]] acdc::core::AcdcResult<std::string> put(std::span<const std::uint8_t> bytes) override
    {
        if (const auto verified{ acdc::core::verifyIdentifier(bytes) }; acdc::core::isError(verified))
        {
            return acdc::core::errorOf(verified);
        }
        const auto container{ acdc::core::Container::decode(bytes) };
        if (acdc::core::isError(container))
        {
            return acdc::core::errorOf(container);
        }

        std::string identifier{ std::get<acdc::core::Container>(container).identifier() };
        upsertContainer(m_db.get(), identifier, bytes);
        return identifier;
    }

    [[nodiscard]] std::vector<std::string> listIdentifiers() const override
    {
        auto stmt = prepare(m_db.get(), "SELECT said FROM containers ORDER BY said;");

        std::vector<std::string> out{};
        int stepRc = sqlite3_step(stmt.get());
        while (stepRc == SQLITE_ROW)
        {
            const unsigned char* text = sqlite3_column_text(stmt.get(), 0);
            const int textBytes = sqlite3_column_bytes(stmt.get(), 0);
            if (text == nullptr || textBytes < 0)
            {
                throw std::runtime_error("resolver: invalid containers row");
            }
            out.emplace_back(reinterpret_cast<const char*>(text), static_cast<std::size_t>(textBytes));
            stepRc = sqlite3_step(stmt.get());
        }
        if (stepRc != SQLITE_DONE)
        {
            throw std::runtime_error(sqliteErr(m_db.get(), "resolver: list containers failed"));
        }
        return out;
    }

    [[nodiscard]] bool remove(std::string_view identifier) override
    {
        auto stmt = prepare(m_db.get(), "DELETE FROM containers WHERE said = ?;");
        bindText(m_db.get(), stmt.get(), 1, identifier);
        if (sqlite3_step(stmt.get()) != SQLITE_DONE)
        {
            throw std::runtime_error(sqliteErr(m_db.get(), "resolver: delete container failed"));
        }
        return sqlite3_changes(m_db.get()) > 0;
    }

private:
    SqliteDbPtr m_db;
};

} // namespace

[[nodiscard]] std::unique_ptr<acdc::resolver::IContainerStore> makeSqliteContainerStore(const std::filesystem::path& dbPath)
{
    auto db = openDb(dbPath, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);
    ensureSchema(db.get());
    return std::make_unique<SqliteContainerStore>(std::move(db));
}

} // namespace acdc::resolver::sqlite
