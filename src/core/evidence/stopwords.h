#pragma once

#include <QSet>
#include <QString>

namespace rc {

// English function words dropped from retrieval queries.
const QSet<QString>& retrievalStopwords();

} // namespace rc
