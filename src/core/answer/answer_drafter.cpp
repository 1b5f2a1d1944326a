#include "core/answer/answer_drafter.h"
#include "core/answer/format_coercion.h"
#include "core/generation/text_cleaner.h"
#include "core/shared/logging.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QRegularExpression>

#include <utility>

namespace rc {

namespace {

// Most specific first: "unopened" before "opened", "non-perishable" before
// "perishable".
constexpr const char* kPolicyQualifiers[] = {
    "non-perishable", "unopened", "opened", "perishable",
    "damaged", "defective", "sealed",
};

constexpr int kPromptRowLimit = 20;

QString joinedSnippets(const RunState& state)
{
    QStringList parts;
    for (const Snippet& snippet : state.snippets) {
        parts.append(snippet.content);
    }
    return parts.join(QLatin1Char(' '));
}

QJsonValue answerFromDays(const FormatHint& hint, std::optional<int> days)
{
    if (!days) {
        return format_coercion::defaultValue(hint);
    }
    if (const auto coerced = format_coercion::coerceJson(hint, QJsonValue(*days))) {
        return *coerced;
    }
    return format_coercion::defaultValue(hint);
}

} // namespace

// ── RuleAnswerDrafter ───────────────────────────────────────

std::optional<int> RuleAnswerDrafter::extractDays(const QString& question, const QString& evidence)
{
    const QString lowerQuestion = question.toLower();

    for (const char* qualifier : kPolicyQualifiers) {
        const QString escaped = QRegularExpression::escape(QLatin1String(qualifier));
        const QRegularExpression named(QStringLiteral("\\b") + escaped + QStringLiteral("\\b"));
        if (!named.match(lowerQuestion).hasMatch()) {
            continue;
        }
        const QRegularExpression pattern(
            QStringLiteral(R"((?<![\w-]))") + escaped + QStringLiteral(R"(s?[:\s]*(\d+)\s*days?\b)"),
            QRegularExpression::CaseInsensitiveOption);
        const QRegularExpressionMatch m = pattern.match(evidence);
        if (m.hasMatch()) {
            return m.captured(1).toInt();
        }
        break;
    }

    static const QRegularExpression anyDays(QStringLiteral(R"((\d+)\s*days?\b)"),
                                            QRegularExpression::CaseInsensitiveOption);
    const QRegularExpressionMatch m = anyDays.match(evidence);
    if (m.hasMatch()) {
        return m.captured(1).toInt();
    }
    return std::nullopt;
}

QJsonValue RuleAnswerDrafter::draft(const RunState& state) const
{
    const FormatHint& hint = state.question.formatHint;

    if (state.route == Route::Document) {
        return answerFromDays(hint, extractDays(state.question.text, joinedSnippets(state)));
    }

    if (!state.queryResult || !state.queryResult->hasRows()) {
        return format_coercion::defaultValue(hint);
    }
    return format_coercion::coerceRows(hint, state.queryResult->columns, state.queryResult->rows);
}

// ── ModelAnswerDrafter ──────────────────────────────────────

ModelAnswerDrafter::ModelAnswerDrafter(std::shared_ptr<GenerationService> generation,
                                       GenerationOptions options)
    : m_generation(std::move(generation))
    , m_options(options)
{
    m_options.jsonOutput = true;
}

QString ModelAnswerDrafter::buildPrompt(const RunState& state)
{
    QString prompt = QStringLiteral(
        "Answer the retail analytics question using only the evidence below.\n"
        "The answer must match the format hint exactly.\n"
        "Respond with JSON: {\"answer\": <value>}\n\n"
        "Question: %1\nFormat hint: %2\n").arg(state.question.text, state.question.formatHint.raw);

    if (state.queryResult && state.queryResult->success) {
        QJsonObject result = state.queryResult->toJson();
        QJsonArray rows = result.value(QStringLiteral("rows")).toArray();
        while (rows.size() > kPromptRowLimit) {
            rows.removeLast();
        }
        result.insert(QStringLiteral("rows"), rows);
        prompt += QStringLiteral("\nQuery result: ")
            + QString::fromUtf8(QJsonDocument(result).toJson(QJsonDocument::Compact))
            + QLatin1Char('\n');
    }

    if (!state.snippets.empty()) {
        prompt += QStringLiteral("\nDocuments:\n");
        for (const Snippet& snippet : state.snippets) {
            prompt += QStringLiteral("[") + snippet.id + QStringLiteral("] ")
                + snippet.content + QLatin1Char('\n');
        }
    }
    return prompt;
}

QJsonValue ModelAnswerDrafter::draft(const RunState& state) const
{
    // A failed or empty query has nothing to answer from.
    if (state.route != Route::Document
        && (!state.queryResult || !state.queryResult->hasRows())) {
        return format_coercion::defaultValue(state.question.formatHint);
    }

    if (!m_generation || !m_generation->isAvailable()) {
        return m_rules.draft(state);
    }

    const std::optional<QString> completion = m_generation->complete(buildPrompt(state), m_options);
    if (!completion) {
        LOG_WARN(rcSynthesis, "Answer generation failed, using rule extraction");
        return m_rules.draft(state);
    }

    const auto obj = TextCleaner::extractJsonObject(*completion);
    if (!obj || !obj->contains(QStringLiteral("answer"))) {
        LOG_WARN(rcSynthesis, "Answer generation returned no answer object");
        return m_rules.draft(state);
    }

    const auto coerced = format_coercion::coerceJson(state.question.formatHint,
                                                     obj->value(QStringLiteral("answer")));
    if (!coerced) {
        LOG_WARN(rcSynthesis, "Generated answer does not fit format hint '%s'",
                 qUtf8Printable(state.question.formatHint.raw));
        return m_rules.draft(state);
    }
    return *coerced;
}

} // namespace rc
