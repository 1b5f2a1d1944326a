#pragma once

#include "core/shared/snippet.h"

#include <QString>
#include <vector>

namespace rc {

// Read-only relevance search over the document corpus.
class EvidenceIndex {
public:
    virtual ~EvidenceIndex() = default;

    // At most topK snippets with score >= minScore, best first.
    // Ties keep corpus order. Never fails: no match returns an empty list.
    virtual std::vector<Snippet> retrieve(const QString& query, int topK,
                                          double minScore = 0.0) const = 0;
};

} // namespace rc
