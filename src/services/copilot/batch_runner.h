#pragma once

#include "core/workflow/orchestrator.h"

#include <QByteArray>
#include <QIODevice>
#include <QJsonObject>
#include <QString>

#include <functional>
#include <optional>

namespace rc {

struct BatchRecord {
    QString id;
    QString question;
    QString formatHint;
};

struct BatchOptions {
    bool includeTrace = false;
    int explanationMaxChars = 200;
};

struct BatchSummary {
    int total = 0;
    int answered = 0;  // records with a non-null final_answer
    int errors = 0;    // malformed lines and failed runs
};

// BatchRunner -- JSONL in, JSONL out.
//
// Input lines:  {"id", "question", "format_hint"}   (format_hint optional)
// Output lines: {"id", "final_answer", "query", "confidence", "explanation",
//                "citations"} plus "trace" when requested.
//
// One output line per non-blank input line, in input order. A malformed
// line or a failed run yields an error record instead of stopping the batch.
class BatchRunner {
public:
    using ProgressCallback = std::function<void(const QJsonObject& record)>;

    BatchRunner(const Orchestrator& orchestrator, BatchOptions options = {});

    // lineNumber is 1-based; used as "line-<n>" when the id is missing.
    static std::optional<BatchRecord> parseLine(const QByteArray& line, int lineNumber,
                                                QString* error);

    QJsonObject processRecord(const BatchRecord& record) const;
    static QJsonObject errorRecord(const QString& id, const QString& error);

    BatchSummary run(QIODevice& input, QIODevice& output,
                     const ProgressCallback& progress = {}) const;

    // Opens both files; false (with errorMessage) if either cannot be opened.
    bool runFiles(const QString& inputPath, const QString& outputPath,
                  BatchSummary* summary, QString* errorMessage,
                  const ProgressCallback& progress = {}) const;

private:
    const Orchestrator& m_orchestrator;
    BatchOptions m_options;
};

} // namespace rc
