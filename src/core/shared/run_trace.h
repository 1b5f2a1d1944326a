#pragma once

#include <QJsonArray>
#include <QString>

#include <vector>

namespace rc {

struct TraceEntry {
    QString stage;
    QString summary;
};

// RunTrace -- append-only log of stage visits, owned by exactly one run.
//
// Move-only so a trace can never be shared between runs; entries are only
// ever added through append().
class RunTrace {
public:
    RunTrace() = default;
    RunTrace(RunTrace&&) noexcept = default;
    RunTrace& operator=(RunTrace&&) noexcept = default;
    RunTrace(const RunTrace&) = delete;
    RunTrace& operator=(const RunTrace&) = delete;

    void append(const QString& stage, const QString& summary);

    const std::vector<TraceEntry>& entries() const { return m_entries; }
    size_t size() const { return m_entries.size(); }
    bool isEmpty() const { return m_entries.empty(); }

    // Number of visits recorded for one stage name.
    int countStage(const QString& stage) const;

    // [{"stage": ..., "summary": ...}, ...]
    QJsonArray toJson() const;

private:
    std::vector<TraceEntry> m_entries;
};

} // namespace rc
