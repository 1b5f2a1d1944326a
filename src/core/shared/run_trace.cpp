#include "core/shared/run_trace.h"

#include <QJsonObject>

#include <algorithm>

namespace rc {

void RunTrace::append(const QString& stage, const QString& summary)
{
    m_entries.push_back({stage, summary});
}

int RunTrace::countStage(const QString& stage) const
{
    return static_cast<int>(std::count_if(m_entries.begin(), m_entries.end(),
        [&stage](const TraceEntry& entry) { return entry.stage == stage; }));
}

QJsonArray RunTrace::toJson() const
{
    QJsonArray array;
    for (const TraceEntry& entry : m_entries) {
        QJsonObject obj;
        obj.insert(QStringLiteral("stage"), entry.stage);
        obj.insert(QStringLiteral("summary"), entry.summary);
        array.append(obj);
    }
    return array;
}

} // namespace rc
