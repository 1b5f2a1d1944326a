#include "core/query/route_classifier.h"
#include "core/generation/text_cleaner.h"
#include "core/shared/logging.h"

#include <QRegularExpression>

#include <utility>

namespace rc {

namespace {

constexpr const char* kCampaignTerms[] = {
    "during", "summer", "winter", "campaign", "calendar", "season",
};

constexpr const char* kDerivedMetricTerms[] = {
    "aov", "average order value", "margin",
};

constexpr const char* kAggregationTerms[] = {
    "revenue", "value", "customer", "quantity", "highest", "top", "total",
};

constexpr const char* kDocumentTerms[] = {
    "policy", "return window", "returns", "definition", "according to",
};

bool containsTerm(const QString& lower, const char* term)
{
    const QRegularExpression re(QStringLiteral("\\b")
                                + QRegularExpression::escape(QLatin1String(term))
                                + QStringLiteral("\\b"));
    return re.match(lower).hasMatch();
}

template <size_t N>
bool containsAny(const QString& lower, const char* const (&terms)[N])
{
    for (const char* term : terms) {
        if (containsTerm(lower, term)) {
            return true;
        }
    }
    return false;
}

} // namespace

// ── RuleRouteClassifier ─────────────────────────────────────

Route RuleRouteClassifier::classifyText(const QString& text)
{
    const QString lower = text.toLower();

    if (containsTerm(lower, "according to") && containsTerm(lower, "policy")) {
        return Route::Document;
    }

    const bool windowOrMetric = containsAny(lower, kCampaignTerms)
        || containsAny(lower, kDerivedMetricTerms);
    if (windowOrMetric && containsAny(lower, kAggregationTerms)) {
        return Route::Hybrid;
    }

    if (containsAny(lower, kDocumentTerms)) {
        return Route::Document;
    }

    return Route::Structured;
}

RouteDecision RuleRouteClassifier::classify(const Question& question) const
{
    return {classifyText(question.text), QStringLiteral("rules")};
}

// ── ModelRouteClassifier ────────────────────────────────────

ModelRouteClassifier::ModelRouteClassifier(std::shared_ptr<GenerationService> generation,
                                           GenerationOptions options)
    : m_generation(std::move(generation))
    , m_options(options)
{
}

QString ModelRouteClassifier::buildPrompt(const Question& question)
{
    return QStringLiteral(
        "Classify the retail analytics question by the evidence it needs.\n"
        "- document: answered from policy or reference documents only\n"
        "- structured: answered by a SQL query over the sales database only\n"
        "- hybrid: needs document facts (campaign dates, KPI definitions) and SQL\n"
        "Respond with JSON: {\"route\": \"document|structured|hybrid\"}\n\n"
        "Question: %1\n").arg(question.text);
}

std::optional<Route> ModelRouteClassifier::parseCompletion(const QString& completion)
{
    if (const auto obj = TextCleaner::extractJsonObject(completion)) {
        const QJsonValue value = obj->value(QStringLiteral("route"));
        if (value.isString()) {
            return routeFromString(value.toString());
        }
    }
    return routeFromString(TextCleaner::normalizeLabel(completion));
}

RouteDecision ModelRouteClassifier::classify(const Question& question) const
{
    if (!m_generation || !m_generation->isAvailable()) {
        LOG_DEBUG(rcRoute, "Generation unavailable, routing by rules");
        return m_rules.classify(question);
    }

    const std::optional<QString> completion =
        m_generation->complete(buildPrompt(question), m_options);
    if (!completion) {
        LOG_WARN(rcRoute, "Route classification failed, routing by rules");
        return m_rules.classify(question);
    }

    const std::optional<Route> route = parseCompletion(*completion);
    if (!route) {
        LOG_WARN(rcRoute, "Unrecognised route label '%s', routing by rules",
                 qUtf8Printable(completion->left(40)));
        return m_rules.classify(question);
    }

    return {*route, QStringLiteral("model")};
}

} // namespace rc
