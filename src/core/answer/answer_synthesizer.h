#pragma once

#include "core/answer/answer_drafter.h"
#include "core/shared/run_state.h"

#include <QJsonValue>
#include <QString>
#include <QStringList>

#include <memory>

namespace rc {

struct Synthesis {
    QJsonValue answer;
    double confidence = 0.0;
    QStringList citations;
    QString explanation;
};

// AnswerSynthesizer -- turns a finished run into its final answer.
//
// Confidence is a heuristic signal, not a calibrated probability:
//   0.5, +0.3 when the query succeeded with rows, +0.2 when any snippet was
//   retrieved, -0.1 per repair; clamped to [0, 1] and rounded to 2 decimals.
//
// Citations are the snippet ids plus, when the query succeeded, every store
// table the final query references; deduplicated and sorted.
class AnswerSynthesizer {
public:
    AnswerSynthesizer(std::shared_ptr<const AnswerDrafter> drafter, QStringList tableNames);

    Synthesis synthesize(const RunState& state) const;

    static double computeConfidence(const RunState& state);
    QStringList collectCitations(const RunState& state) const;
    static QString buildExplanation(const RunState& state);

    // True if the query names the table (case-insensitive, whole words,
    // with or without the spaces in the table name).
    static bool referencesTable(const QString& query, const QString& table);

private:
    std::shared_ptr<const AnswerDrafter> m_drafter;
    QStringList m_tableNames;
};

} // namespace rc
