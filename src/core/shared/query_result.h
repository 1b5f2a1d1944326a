#pragma once

#include <QJsonObject>
#include <QString>
#include <QStringList>
#include <QVariantList>

#include <vector>

namespace rc {

// Outcome of executing one structured query.
struct QueryResult {
    bool success = false;
    QStringList columns;
    std::vector<QVariantList> rows;
    QString error;
    int rowCount = 0;

    static QueryResult failure(const QString& error);
    static QueryResult fromRows(const QStringList& columns, std::vector<QVariantList> rows);

    bool hasRows() const { return success && !rows.empty(); }

    // {"success", "columns", "rows", "error", "row_count"}
    QJsonObject toJson() const;
};

} // namespace rc
