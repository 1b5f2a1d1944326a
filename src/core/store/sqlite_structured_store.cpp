#include "core/store/sqlite_structured_store.h"
#include "core/shared/logging.h"

#include <QFileInfo>
#include <QRegularExpression>

namespace rc {

namespace {

constexpr int kBusyTimeoutMs = 5000;

constexpr const char* kForbiddenKeywords[] = {
    "DROP", "DELETE", "INSERT", "UPDATE", "ALTER",
    "CREATE", "TRUNCATE", "REPLACE", "ATTACH", "PRAGMA",
};

// Blanks the contents of '...' literals and "..." identifiers so their text
// never reads as a keyword. Doubled quotes stay inside the span.
QString blankQuotedSpans(const QString& sql)
{
    QString out = sql;
    QChar open;
    for (int i = 0; i < out.size(); ++i) {
        const QChar c = out.at(i);
        if (open.isNull()) {
            if (c == QLatin1Char('\'') || c == QLatin1Char('"')) {
                open = c;
            }
            continue;
        }
        if (c == open) {
            if (i + 1 < out.size() && out.at(i + 1) == open) {
                out[i] = QLatin1Char(' ');
                out[i + 1] = QLatin1Char(' ');
                ++i;
                continue;
            }
            open = QChar();
            continue;
        }
        out[i] = QLatin1Char(' ');
    }
    return out;
}

QString columnText(sqlite3_stmt* stmt, int col)
{
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return text ? QString::fromUtf8(text) : QString();
}

QVariant columnValue(sqlite3_stmt* stmt, int col)
{
    switch (sqlite3_column_type(stmt, col)) {
    case SQLITE_INTEGER:
        return QVariant(static_cast<qlonglong>(sqlite3_column_int64(stmt, col)));
    case SQLITE_FLOAT:
        return QVariant(sqlite3_column_double(stmt, col));
    case SQLITE_TEXT:
        return QVariant(columnText(stmt, col));
    case SQLITE_BLOB: {
        const int size = sqlite3_column_bytes(stmt, col);
        const char* data = static_cast<const char*>(sqlite3_column_blob(stmt, col));
        return QVariant(QByteArray(data, size));
    }
    default:
        return QVariant();
    }
}

QString quoteIdentifier(const QString& name)
{
    QString escaped = name;
    escaped.replace(QLatin1Char('"'), QStringLiteral("\"\""));
    return QLatin1Char('"') + escaped + QLatin1Char('"');
}

} // namespace

SqliteStructuredStore::~SqliteStructuredStore()
{
    if (m_db) {
        sqlite3_close(m_db);
        m_db = nullptr;
    }
}

// ── Construction ────────────────────────────────────────────

std::optional<SqliteStructuredStore> SqliteStructuredStore::open(const QString& dbPath)
{
    if (!QFileInfo::exists(dbPath)) {
        LOG_ERROR(rcStore, "Database not found: %s", qUtf8Printable(dbPath));
        return std::nullopt;
    }

    SqliteStructuredStore store;
    if (!store.init(dbPath)) {
        return std::nullopt;
    }
    return store;
}

bool SqliteStructuredStore::init(const QString& dbPath)
{
    m_path = dbPath;
    const int flags = SQLITE_OPEN_READONLY | SQLITE_OPEN_FULLMUTEX;
    const int rc = sqlite3_open_v2(dbPath.toUtf8().constData(), &m_db, flags, nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERROR(rcStore, "Failed to open database %s: %s", qUtf8Printable(dbPath),
                  m_db ? sqlite3_errmsg(m_db) : "out of memory");
        return false;
    }

    sqlite3_busy_timeout(m_db, kBusyTimeoutMs);

    if (!loadTableNames()) {
        return false;
    }
    if (m_tableNames.isEmpty()) {
        LOG_ERROR(rcStore, "Database has no tables: %s", qUtf8Printable(dbPath));
        return false;
    }

    m_schemaCache = buildSchema(false);
    m_schemaWithSamplesCache = buildSchema(true);

    LOG_INFO(rcStore, "Structured store opened: %s (%d tables)",
             qUtf8Printable(dbPath), static_cast<int>(m_tableNames.size()));
    return true;
}

bool SqliteStructuredStore::loadTableNames()
{
    const char* sql = R"(
        SELECT name FROM sqlite_master
        WHERE type = 'table' AND name NOT LIKE 'sqlite_%'
        ORDER BY name
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(rcStore, "Cannot list tables: %s", sqlite3_errmsg(m_db));
        return false;
    }

    m_tableNames.clear();
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        m_tableNames.append(columnText(stmt, 0));
    }
    sqlite3_finalize(stmt);
    return true;
}

// ── Schema ──────────────────────────────────────────────────

QString SqliteStructuredStore::schema(bool includeSampleRows) const
{
    return includeSampleRows ? m_schemaWithSamplesCache : m_schemaCache;
}

QString SqliteStructuredStore::buildSchema(bool includeSampleRows) const
{
    QStringList parts;

    for (const QString& table : m_tableNames) {
        const QByteArray pragma =
            (QStringLiteral("PRAGMA table_info(") + quoteIdentifier(table)
             + QLatin1Char(')')).toUtf8();

        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(m_db, pragma.constData(), -1, &stmt, nullptr) != SQLITE_OK) {
            LOG_WARN(rcStore, "table_info failed for %s: %s",
                     qUtf8Printable(table), sqlite3_errmsg(m_db));
            continue;
        }

        QStringList columnDefs;
        QString firstColumn;
        while (sqlite3_step(stmt) == SQLITE_ROW) {
            const QString name = columnText(stmt, 1);
            const QString type = columnText(stmt, 2);
            const bool primaryKey = sqlite3_column_int(stmt, 5) != 0;
            if (firstColumn.isEmpty()) {
                firstColumn = name;
            }
            QString def = QStringLiteral("  ") + name + QLatin1Char(' ') + type;
            if (primaryKey) {
                def += QStringLiteral(" PRIMARY KEY");
            }
            columnDefs.append(def);
        }
        sqlite3_finalize(stmt);

        parts.append(QLatin1Char('"') + table + QStringLiteral("\"(\n")
                     + columnDefs.join(QStringLiteral(",\n")) + QStringLiteral("\n)"));

        if (includeSampleRows && !firstColumn.isEmpty()) {
            const QByteArray sample =
                (QStringLiteral("SELECT * FROM ") + quoteIdentifier(table)
                 + QStringLiteral(" LIMIT 1")).toUtf8();
            sqlite3_stmt* sampleStmt = nullptr;
            if (sqlite3_prepare_v2(m_db, sample.constData(), -1, &sampleStmt, nullptr) == SQLITE_OK
                && sqlite3_step(sampleStmt) == SQLITE_ROW) {
                parts.append(QStringLiteral("  Sample: ") + firstColumn + QLatin1Char('=')
                             + columnText(sampleStmt, 0));
            }
            sqlite3_finalize(sampleStmt);
        }
    }

    return parts.join(QStringLiteral("\n\n"));
}

// ── Validation ──────────────────────────────────────────────

ValidationResult SqliteStructuredStore::validate(const QString& query)
{
    const QString upper = query.trimmed().toUpper();
    if (upper.isEmpty()) {
        return {false, QStringLiteral("Empty query")};
    }

    if (!upper.startsWith(QLatin1String("SELECT")) && !upper.startsWith(QLatin1String("WITH"))) {
        return {false, QStringLiteral("Only SELECT queries are allowed")};
    }

    // REPLACE(...) is the string function; only the statement form is rejected.
    const QString scanned = blankQuotedSpans(upper);
    for (const char* keyword : kForbiddenKeywords) {
        QString pattern = QStringLiteral("\\b") + QLatin1String(keyword) + QStringLiteral("\\b");
        if (qstrcmp(keyword, "REPLACE") == 0) {
            pattern += QStringLiteral("(?!\\s*\\()");
        }
        const QRegularExpression re(pattern);
        if (re.match(scanned).hasMatch()) {
            return {false, QStringLiteral("Keyword %1 not allowed").arg(QLatin1String(keyword))};
        }
    }

    if (scanned.count(QLatin1Char('(')) != scanned.count(QLatin1Char(')'))) {
        return {false, QStringLiteral("Unbalanced parentheses")};
    }

    return {true, QString()};
}

// ── Execution ───────────────────────────────────────────────

QueryResult SqliteStructuredStore::execute(const QString& query) const
{
    const ValidationResult validation = validate(query);
    if (!validation.ok) {
        LOG_WARN(rcStore, "Query rejected: %s", qUtf8Printable(validation.reason));
        return QueryResult::failure(validation.reason);
    }

    const QByteArray sqlUtf8 = query.toUtf8();
    sqlite3_stmt* stmt = nullptr;
    const char* tail = nullptr;
    if (sqlite3_prepare_v2(m_db, sqlUtf8.constData(), -1, &stmt, &tail) != SQLITE_OK) {
        const QString error = QString::fromUtf8(sqlite3_errmsg(m_db));
        sqlite3_finalize(stmt);
        LOG_DEBUG(rcStore, "Prepare failed: %s", qUtf8Printable(error));
        return QueryResult::failure(error);
    }

    if (!stmt) {
        return QueryResult::failure(QStringLiteral("Empty query"));
    }

    if (tail && !QString::fromUtf8(tail).trimmed().remove(QLatin1Char(';')).isEmpty()) {
        sqlite3_finalize(stmt);
        return QueryResult::failure(QStringLiteral("Multiple statements are not allowed"));
    }

    if (!sqlite3_stmt_readonly(stmt)) {
        sqlite3_finalize(stmt);
        return QueryResult::failure(QStringLiteral("Only read-only statements are allowed"));
    }

    const int columnCount = sqlite3_column_count(stmt);
    QStringList columns;
    for (int i = 0; i < columnCount; ++i) {
        const char* name = sqlite3_column_name(stmt, i);
        columns.append(name ? QString::fromUtf8(name) : QString());
    }

    std::vector<QVariantList> rows;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        QVariantList row;
        row.reserve(columnCount);
        for (int i = 0; i < columnCount; ++i) {
            row.append(columnValue(stmt, i));
        }
        rows.push_back(std::move(row));
    }

    if (rc != SQLITE_DONE) {
        const QString error = QString::fromUtf8(sqlite3_errmsg(m_db));
        sqlite3_finalize(stmt);
        LOG_DEBUG(rcStore, "Step failed: %s", qUtf8Printable(error));
        return QueryResult::failure(error);
    }
    sqlite3_finalize(stmt);

    LOG_DEBUG(rcStore, "Query returned %d rows", static_cast<int>(rows.size()));
    return QueryResult::fromRows(columns, std::move(rows));
}

bool SqliteStructuredStore::testConnection() const
{
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, "SELECT 1", -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }
    const bool ok = sqlite3_step(stmt) == SQLITE_ROW && sqlite3_column_int(stmt, 0) == 1;
    sqlite3_finalize(stmt);
    return ok;
}

} // namespace rc
