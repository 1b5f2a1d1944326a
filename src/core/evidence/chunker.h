#pragma once

#include "core/shared/chunk.h"

#include <QString>
#include <vector>

namespace rc {

// Configuration for the Chunker.
// Defined outside the class to avoid the "default member initializer needed
// within enclosing class" issue in C++.
struct ChunkerConfig {
    int maxChunkSize = 500;
    int minParagraphSize = 20;
};

// Chunker -- splits a markdown document into retrieval chunks.
//
//   1. Paragraphs are separated by a blank line (\n\n).
//   2. Paragraphs shorter than minParagraphSize are dropped (headings, rules).
//   3. A paragraph longer than maxChunkSize is split into sentences on
//      . ! ? and the sentences are re-packed into chunks below maxChunkSize.
//
// Chunk IDs are numbered per document in emission order.
class Chunker {
public:
    using Config = ChunkerConfig;

    explicit Chunker(const Config& config = {});

    std::vector<Chunk> chunkContent(const QString& source, const QString& content) const;

private:
    void packSentences(const QString& source, const QString& paragraph,
                       int& chunkIndex, std::vector<Chunk>& out) const;

    Config m_config;
};

} // namespace rc
