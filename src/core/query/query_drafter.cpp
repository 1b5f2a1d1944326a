#include "core/query/query_drafter.h"
#include "core/generation/text_cleaner.h"
#include "core/query/query_template_library.h"
#include "core/shared/logging.h"

#include <QJsonDocument>
#include <QJsonObject>

#include <utility>

namespace rc {

namespace {

QueryDraft fallbackDraft(const DraftRequest& request)
{
    return {QueryTemplateLibrary::safeFallbackQuery(request.question), QStringLiteral("fallback")};
}

// First matching template, or nullptr when the delegate row should handle it.
const QueryTemplate* templateFor(const DraftRequest& request, bool bypassOnRepair)
{
    if (request.repairing && bypassOnRepair) {
        return nullptr;
    }
    const QueryTemplate& entry = QueryTemplateLibrary::match(request.question, request.constraints);
    return QueryTemplateLibrary::isDelegate(entry) ? nullptr : &entry;
}

QueryDraft renderTemplate(const QueryTemplate& entry, const DraftRequest& request)
{
    return {QueryTemplateLibrary::render(entry, request.constraints),
            QStringLiteral("template:") + QLatin1String(entry.name)};
}

QueryDraft checked(QueryDraft draft, const DraftRequest& request)
{
    if (request.repairing && draft.query == request.previousQuery) {
        LOG_WARN(rcPlanner, "Repair re-drafted the failed query unchanged (%s)",
                 qUtf8Printable(draft.source));
    }
    return draft;
}

QString constraintsJson(const Constraints& constraints)
{
    QJsonObject obj;
    for (const auto& [key, value] : constraints) {
        obj.insert(key, value);
    }
    return QString::fromUtf8(QJsonDocument(obj).toJson(QJsonDocument::Compact));
}

} // namespace

// ── TemplateQueryDrafter ────────────────────────────────────

TemplateQueryDrafter::TemplateQueryDrafter(bool bypassTemplatesOnRepair)
    : m_bypassTemplatesOnRepair(bypassTemplatesOnRepair)
{
}

QueryDraft TemplateQueryDrafter::draft(const DraftRequest& request) const
{
    if (const QueryTemplate* entry = templateFor(request, m_bypassTemplatesOnRepair)) {
        return checked(renderTemplate(*entry, request), request);
    }
    return checked(fallbackDraft(request), request);
}

// ── ModelQueryDrafter ───────────────────────────────────────

ModelQueryDrafter::ModelQueryDrafter(std::shared_ptr<GenerationService> generation,
                                     QString schema,
                                     GenerationOptions options,
                                     bool bypassTemplatesOnRepair)
    : m_generation(std::move(generation))
    , m_schema(std::move(schema))
    , m_options(options)
    , m_bypassTemplatesOnRepair(bypassTemplatesOnRepair)
{
}

QueryDraft ModelQueryDrafter::draft(const DraftRequest& request) const
{
    if (const QueryTemplate* entry = templateFor(request, m_bypassTemplatesOnRepair)) {
        return checked(renderTemplate(*entry, request), request);
    }
    return checked(generate(request), request);
}

QString ModelQueryDrafter::buildPrompt(const DraftRequest& request) const
{
    QString prompt = QStringLiteral(
        "Write one SQLite SELECT query that answers the question.\n"
        "Quote the table \"Order Details\" with double quotes. "
        "Revenue is SUM(UnitPrice * Quantity * (1 - Discount)).\n"
        "Return only the SQL, no explanation.\n\n"
        "Schema:\n%1\n\n"
        "Constraints: %2\n").arg(m_schema, constraintsJson(request.constraints));

    if (!request.planningNotes.isEmpty()) {
        prompt += QStringLiteral("Previous attempts failed:\n");
        for (const QString& note : request.planningNotes) {
            prompt += QStringLiteral("- ") + note + QLatin1Char('\n');
        }
    }

    prompt += QStringLiteral("\nQuestion: ") + request.question + QStringLiteral("\nSQL:");
    return prompt;
}

QueryDraft ModelQueryDrafter::generate(const DraftRequest& request) const
{
    if (!m_generation || !m_generation->isAvailable()) {
        LOG_DEBUG(rcPlanner, "Generation unavailable, using fallback query");
        return fallbackDraft(request);
    }

    const std::optional<QString> completion = m_generation->complete(buildPrompt(request), m_options);
    if (!completion) {
        LOG_WARN(rcPlanner, "Query generation failed, using fallback query");
        return fallbackDraft(request);
    }

    const QString query = TextCleaner::cleanQuery(*completion);
    if (query.size() < kMinQueryLength) {
        LOG_WARN(rcPlanner, "Generated query too short (%d chars), using fallback query",
                 static_cast<int>(query.size()));
        return fallbackDraft(request);
    }

    return {query, QStringLiteral("model")};
}

} // namespace rc
