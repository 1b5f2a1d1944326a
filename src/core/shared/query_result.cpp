#include "core/shared/query_result.h"

#include <QJsonArray>
#include <QJsonValue>

namespace rc {

QueryResult QueryResult::failure(const QString& error)
{
    QueryResult result;
    result.success = false;
    result.error = error;
    return result;
}

QueryResult QueryResult::fromRows(const QStringList& columns, std::vector<QVariantList> rows)
{
    QueryResult result;
    result.success = true;
    result.columns = columns;
    result.rows = std::move(rows);
    result.rowCount = static_cast<int>(result.rows.size());
    return result;
}

QJsonObject QueryResult::toJson() const
{
    QJsonArray jsonRows;
    for (const QVariantList& row : rows) {
        QJsonArray jsonRow;
        for (const QVariant& cell : row) {
            jsonRow.append(QJsonValue::fromVariant(cell));
        }
        jsonRows.append(jsonRow);
    }

    QJsonObject json;
    json.insert(QStringLiteral("success"), success);
    json.insert(QStringLiteral("columns"), QJsonArray::fromStringList(columns));
    json.insert(QStringLiteral("rows"), jsonRows);
    json.insert(QStringLiteral("error"),
                error.isEmpty() ? QJsonValue(QJsonValue::Null) : QJsonValue(error));
    json.insert(QStringLiteral("row_count"), rowCount);
    return json;
}

} // namespace rc
