#include "core/answer/answer_synthesizer.h"
#include "core/answer/format_coercion.h"
#include "core/shared/logging.h"

#include <QRegularExpression>

#include <algorithm>
#include <utility>

namespace rc {

namespace {

constexpr double kBaseConfidence = 0.5;
constexpr double kRowsBonus = 0.3;
constexpr double kSnippetBonus = 0.2;
constexpr double kRepairPenalty = 0.1;

} // namespace

AnswerSynthesizer::AnswerSynthesizer(std::shared_ptr<const AnswerDrafter> drafter,
                                     QStringList tableNames)
    : m_drafter(std::move(drafter))
    , m_tableNames(std::move(tableNames))
{
}

Synthesis AnswerSynthesizer::synthesize(const RunState& state) const
{
    Synthesis result;
    if (m_drafter) {
        result.answer = m_drafter->draft(state);
    } else {
        result.answer = format_coercion::defaultValue(state.question.formatHint);
    }
    result.confidence = computeConfidence(state);
    result.citations = collectCitations(state);
    result.explanation = buildExplanation(state);

    LOG_DEBUG(rcSynthesis, "Synthesized answer: confidence=%.2f citations=%d",
              result.confidence, static_cast<int>(result.citations.size()));
    return result;
}

double AnswerSynthesizer::computeConfidence(const RunState& state)
{
    double confidence = kBaseConfidence;
    if (state.queryResult && state.queryResult->hasRows()) {
        confidence += kRowsBonus;
    }
    if (!state.snippets.empty()) {
        confidence += kSnippetBonus;
    }
    confidence -= kRepairPenalty * state.repairCount;
    return format_coercion::round2(std::clamp(confidence, 0.0, 1.0));
}

bool AnswerSynthesizer::referencesTable(const QString& query, const QString& table)
{
    const QStringList words = table.split(QLatin1Char(' '), Qt::SkipEmptyParts);
    if (words.isEmpty()) {
        return false;
    }
    QStringList escaped;
    for (const QString& word : words) {
        escaped.append(QRegularExpression::escape(word));
    }
    const QRegularExpression re(QStringLiteral("\\b") + escaped.join(QStringLiteral("\\s*"))
                                    + QStringLiteral("\\b"),
                                QRegularExpression::CaseInsensitiveOption);
    return re.match(query).hasMatch();
}

QStringList AnswerSynthesizer::collectCitations(const RunState& state) const
{
    QStringList citations;
    for (const Snippet& snippet : state.snippets) {
        citations.append(snippet.id);
    }

    if (state.querySucceeded()) {
        for (const QString& table : m_tableNames) {
            if (referencesTable(state.query, table)) {
                citations.append(table);
            }
        }
    }

    citations.removeDuplicates();
    citations.sort();
    return citations;
}

QString AnswerSynthesizer::buildExplanation(const RunState& state)
{
    const Route route = state.route.value_or(Route::Structured);
    const QString routeName = routeToString(route);
    const int snippetCount = static_cast<int>(state.snippets.size());

    if (route == Route::Document) {
        return QStringLiteral("%1 route: answer taken from %2 document snippet(s)")
            .arg(routeName).arg(snippetCount);
    }

    const int rowCount = state.queryResult ? state.queryResult->rowCount : 0;
    QString explanation = QStringLiteral("%1 route: computed from %2 database row(s)")
                              .arg(routeName).arg(rowCount);
    if (route == Route::Hybrid) {
        explanation += QStringLiteral(" and %1 document snippet(s)").arg(snippetCount);
    }
    if (state.repairCount > 0) {
        explanation += QStringLiteral(" after %1 repair(s)").arg(state.repairCount);
    }
    if (state.queryResult && !state.queryResult->success) {
        explanation += QStringLiteral("; query failed: ") + state.queryResult->error;
    }
    return explanation;
}

} // namespace rc
