#include "core/evidence/fts_evidence_index.h"
#include "core/evidence/stopwords.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QRegularExpression>
#include <QSet>

#include <algorithm>
#include <cmath>

namespace rc {

namespace {

constexpr const char* kSchema = R"(
    CREATE VIRTUAL TABLE evidence USING fts5(
        chunk_id UNINDEXED,
        ordinal UNINDEXED,
        content,
        tokenize = 'unicode61 remove_diacritics 2'
    );
)";

QString columnText(sqlite3_stmt* stmt, int col)
{
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return text ? QString::fromUtf8(text) : QString();
}

} // namespace

FtsEvidenceIndex::~FtsEvidenceIndex()
{
    if (m_db) {
        sqlite3_close(m_db);
        m_db = nullptr;
    }
}

// ── Construction ────────────────────────────────────────────

std::optional<FtsEvidenceIndex> FtsEvidenceIndex::open(const QString& docsDir,
                                                       const ChunkerConfig& config)
{
    const QDir dir(docsDir);
    if (!dir.exists()) {
        LOG_ERROR(rcEvidence, "Docs directory not found: %s", qUtf8Printable(docsDir));
        return std::nullopt;
    }

    const QStringList files = dir.entryList({QStringLiteral("*.md")},
                                            QDir::Files, QDir::Name);
    if (files.isEmpty()) {
        LOG_ERROR(rcEvidence, "No markdown documents in %s", qUtf8Printable(docsDir));
        return std::nullopt;
    }

    FtsEvidenceIndex index;
    const Chunker chunker(config);

    for (const QString& fileName : files) {
        QFile file(dir.filePath(fileName));
        if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
            LOG_WARN(rcEvidence, "Cannot read %s: %s", qUtf8Printable(fileName),
                     qUtf8Printable(file.errorString()));
            continue;
        }
        const QString content = QString::fromUtf8(file.readAll());
        std::vector<Chunk> docChunks = chunker.chunkContent(fileName, content);
        for (Chunk& chunk : docChunks) {
            index.m_chunks.push_back(std::move(chunk));
        }
    }

    if (!index.init()) {
        return std::nullopt;
    }

    LOG_INFO(rcEvidence, "Evidence index ready: %d chunks from %d documents",
             static_cast<int>(index.m_chunks.size()), static_cast<int>(files.size()));
    return index;
}

bool FtsEvidenceIndex::init()
{
    const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE
        | SQLITE_OPEN_MEMORY | SQLITE_OPEN_FULLMUTEX;
    if (sqlite3_open_v2(":memory:", &m_db, flags, nullptr) != SQLITE_OK) {
        LOG_ERROR(rcEvidence, "Failed to open in-memory index: %s",
                  m_db ? sqlite3_errmsg(m_db) : "out of memory");
        return false;
    }

    char* errMsg = nullptr;
    if (sqlite3_exec(m_db, kSchema, nullptr, nullptr, &errMsg) != SQLITE_OK) {
        LOG_ERROR(rcEvidence, "Failed to create FTS5 table: %s",
                  errMsg ? errMsg : "unknown");
        sqlite3_free(errMsg);
        return false;
    }

    return insertChunks();
}

bool FtsEvidenceIndex::insertChunks()
{
    const char* sql = "INSERT INTO evidence (chunk_id, ordinal, content) VALUES (?1, ?2, ?3)";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(rcEvidence, "Insert prepare failed: %s", sqlite3_errmsg(m_db));
        return false;
    }

    if (sqlite3_exec(m_db, "BEGIN", nullptr, nullptr, nullptr) != SQLITE_OK) {
        LOG_ERROR(rcEvidence, "BEGIN failed: %s", sqlite3_errmsg(m_db));
        sqlite3_finalize(stmt);
        return false;
    }
    for (size_t i = 0; i < m_chunks.size(); ++i) {
        const QByteArray idUtf8 = m_chunks[i].chunkId.toUtf8();
        const QByteArray contentUtf8 = m_chunks[i].content.toUtf8();
        sqlite3_bind_text(stmt, 1, idUtf8.constData(), -1, SQLITE_STATIC);
        sqlite3_bind_int(stmt, 2, static_cast<int>(i));
        sqlite3_bind_text(stmt, 3, contentUtf8.constData(), -1, SQLITE_STATIC);
        if (sqlite3_step(stmt) != SQLITE_DONE) {
            LOG_ERROR(rcEvidence, "Insert failed for %s: %s",
                      idUtf8.constData(), sqlite3_errmsg(m_db));
            sqlite3_finalize(stmt);
            sqlite3_exec(m_db, "ROLLBACK", nullptr, nullptr, nullptr);
            return false;
        }
        sqlite3_reset(stmt);
        sqlite3_clear_bindings(stmt);
    }
    sqlite3_finalize(stmt);
    if (sqlite3_exec(m_db, "COMMIT", nullptr, nullptr, nullptr) != SQLITE_OK) {
        LOG_ERROR(rcEvidence, "COMMIT failed: %s", sqlite3_errmsg(m_db));
        return false;
    }
    return true;
}

// ── Search ──────────────────────────────────────────────────

QString FtsEvidenceIndex::buildMatchExpression(const QString& query)
{
    static const QRegularExpression wordRe(QStringLiteral("[\\p{L}\\p{N}_]+"));
    const QSet<QString>& stopwords = retrievalStopwords();

    QStringList terms;
    QSet<QString> seen;
    auto it = wordRe.globalMatch(query.toLower());
    while (it.hasNext()) {
        const QString token = it.next().captured(0);
        if (token.size() < 2 || stopwords.contains(token) || seen.contains(token)) {
            continue;
        }
        seen.insert(token);
        terms.append(QLatin1Char('"') + token + QLatin1Char('"'));
    }
    return terms.join(QStringLiteral(" OR "));
}

double FtsEvidenceIndex::normalizeRank(double rank)
{
    const double magnitude = std::abs(rank);
    return magnitude / (1.0 + magnitude);
}

std::vector<Snippet> FtsEvidenceIndex::retrieve(const QString& query, int topK,
                                                double minScore) const
{
    if (topK <= 0 || !m_db) {
        return {};
    }

    const QString match = buildMatchExpression(query);
    if (match.isEmpty()) {
        LOG_DEBUG(rcEvidence, "Retrieval skipped: no searchable terms in '%s'",
                  qUtf8Printable(query));
        return {};
    }

    const char* sql = R"(
        SELECT chunk_id, ordinal, bm25(evidence)
        FROM evidence
        WHERE evidence MATCH ?1
        ORDER BY bm25(evidence), ordinal
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(rcEvidence, "FTS5 search prepare: %s", sqlite3_errmsg(m_db));
        return {};
    }

    const QByteArray matchUtf8 = match.toUtf8();
    sqlite3_bind_text(stmt, 1, matchUtf8.constData(), -1, SQLITE_STATIC);

    std::vector<Snippet> results;
    int rc = SQLITE_ROW;
    while (static_cast<int>(results.size()) < topK
           && (rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        const int ordinal = sqlite3_column_int(stmt, 1);
        const double score = normalizeRank(sqlite3_column_double(stmt, 2));
        if (score < minScore || ordinal < 0
            || ordinal >= static_cast<int>(m_chunks.size())) {
            continue;
        }

        const Chunk& chunk = m_chunks[static_cast<size_t>(ordinal)];
        Snippet snippet;
        snippet.id = columnText(stmt, 0);
        snippet.content = chunk.content;
        snippet.source = chunk.source;
        snippet.score = score;
        results.push_back(std::move(snippet));
    }
    if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
        LOG_WARN(rcEvidence, "FTS5 search step: %s", sqlite3_errmsg(m_db));
    }
    sqlite3_finalize(stmt);

    LOG_DEBUG(rcEvidence, "Retrieved %d snippets for '%s'",
              static_cast<int>(results.size()), qUtf8Printable(query));
    return results;
}

std::vector<Snippet> FtsEvidenceIndex::searchByKeywords(const QStringList& keywords,
                                                        int topK) const
{
    std::vector<Snippet> results;
    if (keywords.isEmpty() || topK <= 0) {
        return results;
    }

    for (const Chunk& chunk : m_chunks) {
        const QString lower = chunk.content.toLower();
        int matches = 0;
        for (const QString& keyword : keywords) {
            if (lower.contains(keyword.toLower())) {
                ++matches;
            }
        }
        if (matches == 0) {
            continue;
        }
        Snippet snippet;
        snippet.id = chunk.chunkId;
        snippet.content = chunk.content;
        snippet.source = chunk.source;
        snippet.score = static_cast<double>(matches) / keywords.size();
        results.push_back(std::move(snippet));
    }

    std::stable_sort(results.begin(), results.end(),
                     [](const Snippet& a, const Snippet& b) { return a.score > b.score; });
    if (static_cast<int>(results.size()) > topK) {
        results.resize(static_cast<size_t>(topK));
    }
    return results;
}

std::optional<Chunk> FtsEvidenceIndex::chunkById(const QString& chunkId) const
{
    for (const Chunk& chunk : m_chunks) {
        if (chunk.chunkId == chunkId) {
            return chunk;
        }
    }
    return std::nullopt;
}

FtsEvidenceIndex::Stats FtsEvidenceIndex::stats() const
{
    Stats s;
    s.totalChunks = static_cast<int>(m_chunks.size());

    qint64 totalLength = 0;
    for (const Chunk& chunk : m_chunks) {
        totalLength += chunk.content.size();
        if (!s.documents.contains(chunk.source)) {
            s.documents.append(chunk.source);
        }
        ++s.chunksPerDocument[chunk.source];
    }
    s.totalDocuments = s.documents.size();
    if (s.totalChunks > 0) {
        s.avgChunkLength = static_cast<double>(totalLength) / s.totalChunks;
    }
    return s;
}

} // namespace rc
