#include "core/shared/chunk.h"

namespace rc {

QString computeChunkId(const QString& source, int chunkIndex)
{
    QString stem = source;
    if (stem.endsWith(QLatin1String(".md"), Qt::CaseInsensitive)) {
        stem.chop(3);
    }
    return stem + QStringLiteral("::chunk") + QString::number(chunkIndex);
}

} // namespace rc
