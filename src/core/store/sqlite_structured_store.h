#pragma once

#include "core/store/structured_store.h"

#include <QString>
#include <QStringList>

#include <optional>
#include <utility>

#include <sqlite3.h>

namespace rc {

struct ValidationResult {
    bool ok = false;
    QString reason;
};

// SqliteStructuredStore -- read-only adapter over a SQLite database file.
//
// The connection is opened SQLITE_OPEN_READONLY | SQLITE_OPEN_FULLMUTEX so a
// single instance can serve concurrent runs. Queries are checked by
// validate() before preparation, and a prepared statement that SQLite reports
// as writing is refused as well.
class SqliteStructuredStore : public StructuredStore {
public:
    ~SqliteStructuredStore() override;

    SqliteStructuredStore(SqliteStructuredStore&& other) noexcept
        : m_db(other.m_db)
        , m_path(std::move(other.m_path))
        , m_tableNames(std::move(other.m_tableNames))
        , m_schemaCache(std::move(other.m_schemaCache))
        , m_schemaWithSamplesCache(std::move(other.m_schemaWithSamplesCache))
    {
        other.m_db = nullptr;
    }
    SqliteStructuredStore& operator=(SqliteStructuredStore&& other) noexcept {
        if (this != &other) {
            if (m_db) sqlite3_close(m_db);
            m_db = other.m_db;
            other.m_db = nullptr;
            m_path = std::move(other.m_path);
            m_tableNames = std::move(other.m_tableNames);
            m_schemaCache = std::move(other.m_schemaCache);
            m_schemaWithSamplesCache = std::move(other.m_schemaWithSamplesCache);
        }
        return *this;
    }

    SqliteStructuredStore(const SqliteStructuredStore&) = delete;
    SqliteStructuredStore& operator=(const SqliteStructuredStore&) = delete;

    // Returns nullopt (and logs) when the file is missing, cannot be opened,
    // or contains no user tables.
    static std::optional<SqliteStructuredStore> open(const QString& dbPath);

    // ── StructuredStore ─────────────────────────────────────

    QString schema(bool includeSampleRows = false) const override;
    QueryResult execute(const QString& query) const override;
    QStringList tableNames() const override { return m_tableNames; }

    // ── Extras ──────────────────────────────────────────────

    // Static checks only: must start with SELECT or WITH, no write/DDL
    // keywords as whole words, balanced parentheses.
    static ValidationResult validate(const QString& query);

    // Runs "SELECT 1".
    bool testConnection() const;

    const QString& path() const { return m_path; }

private:
    SqliteStructuredStore() = default;

    bool init(const QString& dbPath);
    bool loadTableNames();
    QString buildSchema(bool includeSampleRows) const;

    sqlite3* m_db = nullptr;
    QString m_path;
    QStringList m_tableNames;
    QString m_schemaCache;
    QString m_schemaWithSamplesCache;
};

} // namespace rc
