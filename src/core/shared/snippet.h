#pragma once

#include <QString>

namespace rc {

// A ranked span of reference-document text returned by an EvidenceIndex.
struct Snippet {
    QString id;      // "<document stem>::chunk<N>"
    QString content;
    QString source;  // document file name
    double score = 0.0; // relevance in [0, 1]
};

} // namespace rc
