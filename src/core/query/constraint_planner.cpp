#include "core/query/constraint_planner.h"
#include "core/shared/logging.h"

#include <QRegularExpression>

namespace rc {

namespace {

struct CampaignEntry {
    const char* name;
    const char* alias;
    const char* startDate;
    const char* endDate;
};

constexpr CampaignEntry kCampaigns[] = {
    {"Summer Beverages 1997", "summer", "1997-06-01", "1997-06-30"},
    {"Winter Classics 1997",  "winter", "1997-12-01", "1997-12-31"},
};

struct CategoryEntry {
    const char* keyword;
    const char* category;
};

constexpr CategoryEntry kCategories[] = {
    {"beverage",   "Beverages"},
    {"condiment",  "Condiments"},
    {"confection", "Confections"},
    {"dairy",      "Dairy Products"},
    {"cheese",     "Dairy Products"},
    {"grain",      "Grains/Cereals"},
    {"cereal",     "Grains/Cereals"},
    {"meat",       "Meat/Poultry"},
    {"poultry",    "Meat/Poultry"},
    {"produce",    "Produce"},
    {"seafood",    "Seafood"},
};

struct MetricEntry {
    const char* keyword;
    const char* metric;
    const char* formula;
};

// Gross margin approximates cost as 70% of unit price.
constexpr MetricEntry kMetrics[] = {
    {"average order value", "aov",
     "SUM(od.UnitPrice * od.Quantity * (1 - od.Discount)) / COUNT(DISTINCT o.OrderID)"},
    {"aov", "aov",
     "SUM(od.UnitPrice * od.Quantity * (1 - od.Discount)) / COUNT(DISTINCT o.OrderID)"},
    {"margin", "gross_margin",
     "SUM((od.UnitPrice - od.UnitPrice * 0.7) * od.Quantity * (1 - od.Discount))"},
    {"revenue", "revenue",
     "SUM(od.UnitPrice * od.Quantity * (1 - od.Discount))"},
};

bool containsWord(const QString& lower, const char* word)
{
    const QRegularExpression re(QStringLiteral("\\b")
                                + QRegularExpression::escape(QLatin1String(word))
                                + QStringLiteral("\\b"));
    return re.match(lower).hasMatch();
}

const CampaignEntry* findCampaign(const QString& question,
                                  const std::vector<Snippet>& snippets)
{
    const QString lower = question.toLower();
    for (const CampaignEntry& entry : kCampaigns) {
        if (lower.contains(QString::fromLatin1(entry.name).toLower())
            || containsWord(lower, entry.alias)) {
            return &entry;
        }
    }

    for (const Snippet& snippet : snippets) {
        for (const CampaignEntry& entry : kCampaigns) {
            if (snippet.content.contains(QLatin1String(entry.name), Qt::CaseInsensitive)
                && lower.contains(QLatin1String("campaign"))) {
                return &entry;
            }
        }
    }
    return nullptr;
}

} // namespace

QString ConstraintPlanner::formulaForMetric(const QString& metric)
{
    for (const MetricEntry& entry : kMetrics) {
        if (metric == QLatin1String(entry.metric)) {
            return QString::fromLatin1(entry.formula);
        }
    }
    return {};
}

Constraints ConstraintPlanner::plan(const QString& question,
                                    const std::vector<Snippet>& snippets) const
{
    namespace keys = constraint_keys;
    Constraints constraints;
    const QString lower = question.toLower();

    // Category keywords inside a campaign name do not name a category.
    QString categoryText = lower;
    if (const CampaignEntry* campaign = findCampaign(question, snippets)) {
        constraints[keys::kCampaign] = QString::fromLatin1(campaign->name);
        constraints[keys::kStartDate] = QString::fromLatin1(campaign->startDate);
        constraints[keys::kEndDate] = QString::fromLatin1(campaign->endDate);
        categoryText.remove(QString::fromLatin1(campaign->name).toLower());
    }

    for (const CategoryEntry& entry : kCategories) {
        if (categoryText.contains(QLatin1String(entry.keyword))) {
            constraints[keys::kCategory] = QString::fromLatin1(entry.category);
            break;
        }
    }

    for (const MetricEntry& entry : kMetrics) {
        if (containsWord(lower, entry.keyword)) {
            constraints[keys::kMetric] = QString::fromLatin1(entry.metric);
            constraints[keys::kMetricFormula] = QString::fromLatin1(entry.formula);
            break;
        }
    }

    if (constraints.find(keys::kStartDate) == constraints.end()) {
        static const QRegularExpression yearRe(QStringLiteral(R"(\b(19|20)\d{2}\b)"));
        const QRegularExpressionMatch m = yearRe.match(lower);
        if (m.hasMatch()) {
            constraints[keys::kYear] = m.captured(0);
        }
    }

    static const QRegularExpression topNRe(QStringLiteral(R"(\btop\s+(\d+)\b)"));
    const QRegularExpressionMatch topN = topNRe.match(lower);
    if (topN.hasMatch()) {
        constraints[keys::kTopN] = topN.captured(1);
    }

    LOG_DEBUG(rcPlanner, "Planned %d constraints", static_cast<int>(constraints.size()));
    return constraints;
}

} // namespace rc
