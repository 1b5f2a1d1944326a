#include "core/evidence/chunker.h"
#include "core/shared/logging.h"

#include <QRegularExpression>
#include <QStringList>

namespace rc {

namespace {

Chunk makeChunk(const QString& source, int chunkIndex, const QString& content)
{
    Chunk c;
    c.chunkId = computeChunkId(source, chunkIndex);
    c.source = source;
    c.chunkIndex = chunkIndex;
    c.content = content;
    return c;
}

} // namespace

// ── Construction ────────────────────────────────────────────

Chunker::Chunker(const Config& config)
    : m_config(config)
{
    if (m_config.maxChunkSize < 1) {
        m_config.maxChunkSize = 1;
    }
    if (m_config.minParagraphSize < 0) {
        m_config.minParagraphSize = 0;
    }
}

// ── Public API ──────────────────────────────────────────────

std::vector<Chunk> Chunker::chunkContent(const QString& source, const QString& content) const
{
    std::vector<Chunk> chunks;

    if (content.isEmpty()) {
        return chunks;
    }

    QString normalized = content;
    normalized.replace(QStringLiteral("\r\n"), QStringLiteral("\n"));

    const QStringList paragraphs = normalized.split(QStringLiteral("\n\n"));
    int chunkIndex = 0;

    for (const QString& rawParagraph : paragraphs) {
        const QString paragraph = rawParagraph.trimmed();
        if (paragraph.isEmpty() || paragraph.size() < m_config.minParagraphSize) {
            continue;
        }

        if (paragraph.size() > m_config.maxChunkSize) {
            packSentences(source, paragraph, chunkIndex, chunks);
        } else {
            chunks.push_back(makeChunk(source, chunkIndex++, paragraph));
        }
    }

    LOG_DEBUG(rcEvidence, "Chunked %s: %d chunks from %d chars",
              qUtf8Printable(source),
              static_cast<int>(chunks.size()),
              static_cast<int>(content.size()));

    return chunks;
}

// ── Private helpers ─────────────────────────────────────────

void Chunker::packSentences(const QString& source, const QString& paragraph,
                            int& chunkIndex, std::vector<Chunk>& out) const
{
    static const QRegularExpression sentenceEnd(QStringLiteral("[.!?]+"));
    const QStringList sentences = paragraph.split(sentenceEnd);

    QString current;
    for (const QString& rawSentence : sentences) {
        const QString sentence = rawSentence.trimmed();
        if (sentence.isEmpty()) {
            continue;
        }

        if (current.size() + sentence.size() < m_config.maxChunkSize) {
            current += sentence + QStringLiteral(". ");
        } else {
            if (!current.isEmpty()) {
                out.push_back(makeChunk(source, chunkIndex++, current.trimmed()));
            }
            current = sentence + QStringLiteral(". ");
        }
    }

    if (!current.isEmpty()) {
        out.push_back(makeChunk(source, chunkIndex++, current.trimmed()));
    }
}

} // namespace rc
