#pragma once

#include "core/shared/query_result.h"
#include "core/shared/run_trace.h"
#include "core/shared/snippet.h"
#include "core/shared/types.h"

#include <QJsonValue>
#include <QString>
#include <QStringList>

#include <map>
#include <optional>
#include <vector>

namespace rc {

// Named filter/formula values derived from the question and evidence.
// Ordered so prompts and trace summaries are reproducible.
using Constraints = std::map<QString, QString>;

namespace constraint_keys {
inline const QString kCampaign = QStringLiteral("campaign");
inline const QString kStartDate = QStringLiteral("start_date");
inline const QString kEndDate = QStringLiteral("end_date");
inline const QString kCategory = QStringLiteral("category");
inline const QString kMetric = QStringLiteral("metric");
inline const QString kMetricFormula = QStringLiteral("metric_formula");
inline const QString kYear = QStringLiteral("year");
inline const QString kTopN = QStringLiteral("top_n");
} // namespace constraint_keys

// The single mutable record threaded through one workflow run.
struct RunState {
    Question question;

    std::optional<Route> route;
    QString routeSource;

    std::vector<Snippet> snippets;
    Constraints constraints;

    // Failure reasons appended by the repair stage, read by query drafting.
    QStringList planningNotes;

    QString query;
    QString querySource;
    std::optional<QueryResult> queryResult;

    int repairCount = 0;

    std::optional<QJsonValue> finalAnswer;
    double confidence = 0.0;
    QStringList citations;
    QString explanation;

    RunTrace trace;

    bool querySucceeded() const { return queryResult.has_value() && queryResult->success; }
};

} // namespace rc
