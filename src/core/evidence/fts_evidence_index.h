#pragma once

#include "core/evidence/chunker.h"
#include "core/evidence/evidence_index.h"
#include "core/shared/chunk.h"

#include <QString>
#include <QStringList>

#include <map>
#include <optional>
#include <utility>
#include <vector>

#include <sqlite3.h>

namespace rc {

// FtsEvidenceIndex -- in-memory SQLite FTS5 index over markdown documents.
//
// Every *.md file in the docs directory is chunked once at open() and the
// chunks are inserted into an FTS5 table. retrieve() ranks with bm25 and maps
// the raw rank onto [0, 1) so callers can apply a relevance floor.
//
// The connection is opened with SQLITE_OPEN_FULLMUTEX and is never written
// after open(), so concurrent retrieve() calls are safe.
class FtsEvidenceIndex : public EvidenceIndex {
public:
    struct Stats {
        int totalChunks = 0;
        int totalDocuments = 0;
        QStringList documents;
        std::map<QString, int> chunksPerDocument;
        double avgChunkLength = 0.0;
    };

    ~FtsEvidenceIndex() override;

    FtsEvidenceIndex(FtsEvidenceIndex&& other) noexcept
        : m_db(other.m_db), m_chunks(std::move(other.m_chunks))
    {
        other.m_db = nullptr;
    }
    FtsEvidenceIndex& operator=(FtsEvidenceIndex&& other) noexcept {
        if (this != &other) {
            if (m_db) sqlite3_close(m_db);
            m_db = other.m_db;
            other.m_db = nullptr;
            m_chunks = std::move(other.m_chunks);
        }
        return *this;
    }

    FtsEvidenceIndex(const FtsEvidenceIndex&) = delete;
    FtsEvidenceIndex& operator=(const FtsEvidenceIndex&) = delete;

    // Returns nullopt (and logs) if docsDir does not exist, contains no
    // markdown files, or the FTS5 table cannot be created.
    static std::optional<FtsEvidenceIndex> open(const QString& docsDir,
                                                const ChunkerConfig& config = {});

    std::vector<Snippet> retrieve(const QString& query, int topK,
                                  double minScore = 0.0) const override;

    // Chunks that contain any of the keywords (case-insensitive substring),
    // scored by the fraction of keywords present, best first, at most topK.
    std::vector<Snippet> searchByKeywords(const QStringList& keywords, int topK = 5) const;

    std::optional<Chunk> chunkById(const QString& chunkId) const;
    const std::vector<Chunk>& chunks() const { return m_chunks; }
    Stats stats() const;

    // Builds the FTS5 MATCH expression: lower-cased word tokens, stopwords and
    // single characters removed, each token quoted, joined with OR.
    static QString buildMatchExpression(const QString& query);

    // bm25 rank (more negative is better) -> relevance in [0, 1).
    static double normalizeRank(double rank);

private:
    FtsEvidenceIndex() = default;

    bool init();
    bool insertChunks();

    sqlite3* m_db = nullptr;
    std::vector<Chunk> m_chunks;
};

} // namespace rc
