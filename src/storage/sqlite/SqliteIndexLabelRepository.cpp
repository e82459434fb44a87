#include "nopassplz/storage/sqlite/SqliteIndexLabelRepositoryFactory.hpp"

#include "nopassplz/storage/IIndexLabelRepository.hpp"
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <limits>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <sqlite3.h>

namespace nopassplz::storage::sqlite
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
        std::string msg = sqliteErr(db, "labels: sqlite3_exec failed");
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
        throw std::runtime_error(sqliteErr(raw, "labels: sqlite3_open_v2 failed"));
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
        throw std::runtime_error(sqliteErr(db, "labels: sqlite3_prepare_v2 failed"));
    }
    return stmt;
}

void bindIndex(sqlite3* db, sqlite3_stmt* stmt, int pos, std::int64_t index)
{
    if (sqlite3_bind_int64(stmt, pos, index) != SQLITE_OK)
    {
        throw std::runtime_error(sqliteErr(db, "labels: bind index failed"));
    }
}

void bindText(sqlite3* db, sqlite3_stmt* stmt, int pos, std::string_view text)
{
    if (sqlite3_bind_text(stmt, pos, text.data(), static_cast<int>(text.size()), SQLITE_STATIC) != SQLITE_OK)
    {
        throw std::runtime_error(sqliteErr(db, "labels: bind text failed"));
    }
}

[[nodiscard]] std::string columnText(sqlite3_stmt* stmt, int col)
{
    const auto* text = sqlite3_column_text(stmt, col);
    const int bytes = sqlite3_column_bytes(stmt, col);
    if (text == nullptr || bytes <= 0)
    {
        return {};
    }
    return std::string{ reinterpret_cast<const char*>(text), static_cast<std::size_t>(bytes) };
}

[[nodiscard]] IndexLabel readLabel(sqlite3_stmt* stmt, int firstCol)
{
    IndexLabel out{};
    out.title = columnText(stmt, firstCol);
    out.description = columnText(stmt, firstCol + 1);
    out.exposed = sqlite3_column_int(stmt, firstCol + 2) != 0;
    return out;
}

void ensureSchema(sqlite3* db)
{
    exec(db, "CREATE TABLE IF NOT EXISTS index_label ("
             " idx INTEGER PRIMARY KEY CHECK(idx >= 0 AND idx <= 4294967295),"
             " title TEXT NOT NULL CHECK(length(title) > 0),"
             " description TEXT NOT NULL DEFAULT '',"
             " exposed INTEGER NOT NULL DEFAULT 0"
             ");");
}

class SqliteIndexLabelRepository final : public nopassplz::storage::IIndexLabelRepository
{
public:
    explicit SqliteIndexLabelRepository(std::filesystem::path dbFile) : m_dbFile(std::move(dbFile))
    {
        auto db = openDb(m_dbFile, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);
        ensureSchema(db.get());
    }

    [[nodiscard]] std::optional<IndexLabel> load(std::uint32_t index) const override
    {
        auto db = openDb(m_dbFile, SQLITE_OPEN_READONLY);
        auto stmt = prepare(db.get(), "SELECT title, description, exposed FROM index_label WHERE idx = ?;");
        bindIndex(db.get(), stmt.get(), 1, index);

        const int stepRc = sqlite3_step(stmt.get());
        if (stepRc == SQLITE_ROW)
        {
            return readLabel(stmt.get(), 0);
        }
        if (stepRc == SQLITE_DONE)
        {
            return std::nullopt;
        }
        throw std::runtime_error(sqliteErr(db.get(), "labels: select label failed"));
    }

    void store(std::uint32_t index, const IndexLabel& label) override
    {
        if (label.title.empty())
        {
            throw std::invalid_argument("labels: title must not be empty");
        }

        auto db = openDb(m_dbFile, SQLITE_OPEN_READWRITE);
        auto stmt = prepare(db.get(), "INSERT INTO index_label(idx, title, description, exposed) VALUES (?, ?, ?, ?)"
                                      " ON CONFLICT(idx) DO UPDATE SET title=excluded.title,"
                                      " description=excluded.description, exposed=excluded.exposed;");
        bindIndex(db.get(), stmt.get(), 1, index);
        bindText(db.get(), stmt.get(), 2, label.title);
        bindText(db.get(), stmt.get(), 3, label.description);
        if (sqlite3_bind_int(stmt.get(), 4, label.exposed ? 1 : 0) != SQLITE_OK)
        {
            throw std::runtime_error(sqliteErr(db.get(), "labels: bind exposed failed"));
        }

        if (sqlite3_step(stmt.get()) != SQLITE_DONE)
        {
            throw std::runtime_error(sqliteErr(db.get(), "labels: upsert label failed"));
        }
    }

    [[nodiscard]] bool remove(std::uint32_t index) override
    {
        auto db = openDb(m_dbFile, SQLITE_OPEN_READWRITE);
        auto stmt = prepare(db.get(), "DELETE FROM index_label WHERE idx = ?;");
        bindIndex(db.get(), stmt.get(), 1, index);

        if (sqlite3_step(stmt.get()) != SQLITE_DONE)
        {
            throw std::runtime_error(sqliteErr(db.get(), "labels: delete label failed"));
        }
        return sqlite3_changes(db.get()) > 0;
    }

    [[nodiscard]] std::vector<LabeledIndex> list(std::uint32_t offset, std::size_t limit) const override
    {
        std::vector<LabeledIndex> out{};
        if (limit == 0U)
        {
            return out;
        }

        // Computed in 64 bits so the last page of the index space does not wrap. Limits reaching past
        // the highest index are clamped to it.
        constexpr std::uint64_t kIndexSpace{ std::uint64_t{ std::numeric_limits<std::uint32_t>::max() } + 1U };
        const std::uint64_t count{ std::min<std::uint64_t>(limit, kIndexSpace - offset) };
        const std::int64_t first{ offset };
        const std::int64_t last{ first + static_cast<std::int64_t>(count) };

        auto db = openDb(m_dbFile, SQLITE_OPEN_READONLY);
        auto stmt = prepare(db.get(), "SELECT idx, title, description, exposed FROM index_label"
                                      " WHERE idx >= ? AND idx < ? ORDER BY idx;");
        bindIndex(db.get(), stmt.get(), 1, first);
        bindIndex(db.get(), stmt.get(), 2, last);

        int stepRc = sqlite3_step(stmt.get());
        while (stepRc == SQLITE_ROW)
        {
            LabeledIndex row{};
            row.index = static_cast<std::uint32_t>(sqlite3_column_int64(stmt.get(), 0));
            row.label = readLabel(stmt.get(), 1);
            out.push_back(std::move(row));
            stepRc = sqlite3_step(stmt.get());
        }
        if (stepRc != SQLITE_DONE)
        {
            throw std::runtime_error(sqliteErr(db.get(), "labels: select labels failed"));
        }
        return out;
    }

private:
    std::filesystem::path m_dbFile;
};

} // namespace

[[nodiscard]] std::unique_ptr<nopassplz::storage::IIndexLabelRepository>
makeSqliteIndexLabelRepository(const std::filesystem::path& dbFile)
{
    return std::make_unique<SqliteIndexLabelRepository>(dbFile);
}

} // namespace nopassplz::storage::sqlite
