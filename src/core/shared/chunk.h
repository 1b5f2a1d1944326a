#pragma once

#include <QString>

namespace rc {

struct Chunk {
    QString chunkId;
    QString source;      // document file name, e.g. "product_policy.md"
    int chunkIndex = 0;  // position within the document
    QString content;
};

// Stable chunk ID: "<file name without .md>::chunk<index>"
QString computeChunkId(const QString& source, int chunkIndex);

} // namespace rc
