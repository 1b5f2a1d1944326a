#include "core/workflow/orchestrator.h"
#include "core/answer/format_coercion.h"
#include "core/query/query_template_library.h"
#include "core/shared/logging.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

#include <exception>
#include <utility>

namespace rc {

namespace {

constexpr int kQueryPreviewChars = 80;
constexpr int kAnswerPreviewChars = 50;

QString preview(const QString& text, int maxChars)
{
    QString flat = text.simplified();
    if (flat.size() > maxChars) {
        flat = flat.left(maxChars) + QStringLiteral("...");
    }
    return flat;
}

QString jsonPreview(const QJsonValue& value)
{
    QString text;
    if (value.isObject()) {
        text = QString::fromUtf8(QJsonDocument(value.toObject()).toJson(QJsonDocument::Compact));
    } else if (value.isArray()) {
        text = QString::fromUtf8(QJsonDocument(value.toArray()).toJson(QJsonDocument::Compact));
    } else if (value.isNull() || value.isUndefined()) {
        text = QStringLiteral("null");
    } else if (value.isString()) {
        text = value.toString();
    } else if (value.isBool()) {
        text = value.toBool() ? QStringLiteral("true") : QStringLiteral("false");
    } else {
        text = QString::number(value.toDouble());
    }
    return preview(text, kAnswerPreviewChars);
}

} // namespace

QString stageToString(Stage stage)
{
    switch (stage) {
    case Stage::Route:        return QStringLiteral("route");
    case Stage::Retrieve:     return QStringLiteral("retrieve");
    case Stage::Plan:         return QStringLiteral("plan");
    case Stage::DraftQuery:   return QStringLiteral("draft_query");
    case Stage::ExecuteQuery: return QStringLiteral("execute_query");
    case Stage::Repair:       return QStringLiteral("repair");
    case Stage::Synthesize:   return QStringLiteral("synthesize");
    case Stage::Done:         return QStringLiteral("done");
    }
    return QStringLiteral("done");
}

Orchestrator::Orchestrator(std::shared_ptr<const RouteClassifier> classifier,
                           std::shared_ptr<const EvidenceIndex> evidence,
                           std::shared_ptr<const QueryDrafter> drafter,
                           std::shared_ptr<const StructuredStore> store,
                           std::shared_ptr<const AnswerSynthesizer> synthesizer,
                           OrchestratorConfig config)
    : m_classifier(std::move(classifier))
    , m_evidence(std::move(evidence))
    , m_drafter(std::move(drafter))
    , m_store(std::move(store))
    , m_synthesizer(std::move(synthesizer))
    , m_config(config)
{
    if (m_config.maxRepairs < 0) {
        m_config.maxRepairs = 0;
    }
}

// ── Transitions ─────────────────────────────────────────────

Stage Orchestrator::next(Stage stage, const RunState& state, int maxRepairs)
{
    const Route route = state.route.value_or(Route::Structured);

    switch (stage) {
    case Stage::Route:
        return route == Route::Structured ? Stage::Plan : Stage::Retrieve;
    case Stage::Retrieve:
        return route == Route::Document ? Stage::Synthesize : Stage::Plan;
    case Stage::Plan:
        return Stage::DraftQuery;
    case Stage::DraftQuery:
        return Stage::ExecuteQuery;
    case Stage::ExecuteQuery:
        if (!state.querySucceeded() && state.repairCount < maxRepairs) {
            return Stage::Repair;
        }
        return Stage::Synthesize;
    case Stage::Repair:
        return Stage::DraftQuery;
    case Stage::Synthesize:
    case Stage::Done:
        return Stage::Done;
    }
    return Stage::Done;
}

// ── Run ─────────────────────────────────────────────────────

RunState Orchestrator::run(const Question& question) const
{
    RunState state;
    state.question = question;

    Stage stage = Stage::Route;
    while (stage != Stage::Done) {
        visit(stage, state);
        stage = next(stage, state, m_config.maxRepairs);
    }

    LOG_INFO(rcWorkflow, "Run finished: route=%s repairs=%d confidence=%.2f stages=%d",
             qUtf8Printable(routeToString(state.route.value_or(Route::Structured))),
             state.repairCount, state.confidence, static_cast<int>(state.trace.size()));
    return state;
}

void Orchestrator::visit(Stage stage, RunState& state) const
{
    LOG_DEBUG(rcWorkflow, "Stage %s", qUtf8Printable(stageToString(stage)));

    switch (stage) {
    case Stage::Route:        routeStage(state); break;
    case Stage::Retrieve:     retrieveStage(state); break;
    case Stage::Plan:         planStage(state); break;
    case Stage::DraftQuery:   draftQueryStage(state); break;
    case Stage::ExecuteQuery: executeQueryStage(state); break;
    case Stage::Repair:       repairStage(state); break;
    case Stage::Synthesize:   synthesizeStage(state); break;
    case Stage::Done:         break;
    }
}

// ── Stages ──────────────────────────────────────────────────

void Orchestrator::routeStage(RunState& state) const
{
    RouteDecision decision{RuleRouteClassifier::classifyText(state.question.text),
                           QStringLiteral("rules")};
    if (m_classifier) {
        try {
            decision = m_classifier->classify(state.question);
        } catch (const std::exception& e) {
            LOG_WARN(rcWorkflow, "Route classifier failed (%s), routing by rules", e.what());
        }
    }

    state.route = decision.route;
    state.routeSource = decision.source;
    state.trace.append(stageToString(Stage::Route),
                       QStringLiteral("%1 (%2)").arg(routeToString(decision.route),
                                                     decision.source));
}

void Orchestrator::retrieveStage(RunState& state) const
{
    try {
        if (m_evidence) {
            state.snippets = m_evidence->retrieve(state.question.text, m_config.retrievalTopK,
                                                  m_config.minRelevance);
        }
    } catch (const std::exception& e) {
        LOG_WARN(rcWorkflow, "Retrieval failed: %s", e.what());
        state.snippets.clear();
    }

    QStringList ids;
    for (const Snippet& snippet : state.snippets) {
        ids.append(snippet.id);
    }
    QString summary = QStringLiteral("%1 snippet(s)").arg(static_cast<int>(state.snippets.size()));
    if (!ids.isEmpty()) {
        summary += QStringLiteral(": ") + ids.join(QStringLiteral(", "));
    }
    state.trace.append(stageToString(Stage::Retrieve), summary);
}

void Orchestrator::planStage(RunState& state) const
{
    state.constraints = m_planner.plan(state.question.text, state.snippets);

    QStringList parts;
    for (const auto& [key, value] : state.constraints) {
        if (key == constraint_keys::kMetricFormula) {
            continue;
        }
        parts.append(key + QLatin1Char('=') + value);
    }
    state.trace.append(stageToString(Stage::Plan),
                       parts.isEmpty() ? QStringLiteral("no constraints")
                                       : parts.join(QStringLiteral(", ")));
}

void Orchestrator::draftQueryStage(RunState& state) const
{
    DraftRequest request;
    request.question = state.question.text;
    request.constraints = state.constraints;
    request.planningNotes = state.planningNotes;
    request.repairing = state.repairCount > 0;
    request.previousQuery = state.query;

    QueryDraft draft{QueryTemplateLibrary::safeFallbackQuery(state.question.text),
                     QStringLiteral("fallback")};
    if (m_drafter) {
        try {
            draft = m_drafter->draft(request);
        } catch (const std::exception& e) {
            LOG_WARN(rcWorkflow, "Query drafting failed (%s), using fallback query", e.what());
        }
    }

    state.query = draft.query;
    state.querySource = draft.source;
    state.trace.append(stageToString(Stage::DraftQuery),
                       QStringLiteral("%1: %2").arg(draft.source,
                                                    preview(draft.query, kQueryPreviewChars)));
}

void Orchestrator::executeQueryStage(RunState& state) const
{
    QueryResult result = QueryResult::failure(QStringLiteral("no structured store available"));
    if (m_store) {
        try {
            result = m_store->execute(state.query);
        } catch (const std::exception& e) {
            LOG_WARN(rcWorkflow, "Query execution threw: %s", e.what());
            result = QueryResult::failure(QString::fromUtf8(e.what()));
        }
    }

    const QString summary = result.success
        ? QStringLiteral("success, %1 row(s)").arg(result.rowCount)
        : QStringLiteral("failed: %1").arg(preview(result.error, kQueryPreviewChars));
    state.queryResult = std::move(result);
    state.trace.append(stageToString(Stage::ExecuteQuery), summary);
}

void Orchestrator::repairStage(RunState& state) const
{
    ++state.repairCount;

    const QString error = state.queryResult ? state.queryResult->error : QString();
    state.planningNotes.append(QStringLiteral("Attempt %1 failed with error '%2' for query: %3")
                                   .arg(state.repairCount)
                                   .arg(error, state.query.simplified()));

    LOG_INFO(rcWorkflow, "Repair attempt %d: %s", state.repairCount, qUtf8Printable(error));
    state.trace.append(stageToString(Stage::Repair),
                       QStringLiteral("attempt %1: %2").arg(state.repairCount)
                           .arg(preview(error, kQueryPreviewChars)));
}

void Orchestrator::synthesizeStage(RunState& state) const
{
    Synthesis synthesis;
    synthesis.answer = format_coercion::defaultValue(state.question.formatHint);
    synthesis.confidence = AnswerSynthesizer::computeConfidence(state);
    synthesis.explanation = AnswerSynthesizer::buildExplanation(state);
    if (m_synthesizer) {
        try {
            synthesis = m_synthesizer->synthesize(state);
        } catch (const std::exception& e) {
            LOG_WARN(rcWorkflow, "Synthesis failed (%s), using default answer", e.what());
            synthesis.explanation = QStringLiteral("synthesis failed: %1").arg(QString::fromUtf8(e.what()));
        }
    }

    state.finalAnswer = synthesis.answer;
    state.confidence = synthesis.confidence;
    state.citations = synthesis.citations;
    state.explanation = synthesis.explanation;
    state.trace.append(stageToString(Stage::Synthesize),
                       QStringLiteral("answer=%1").arg(jsonPreview(synthesis.answer)));
}

} // namespace rc
