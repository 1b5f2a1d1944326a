#pragma once

#include "core/shared/query_result.h"

#include <QString>
#include <QStringList>

namespace rc {

// Read-only relational store the workflow queries.
class StructuredStore {
public:
    virtual ~StructuredStore() = default;

    // Textual schema description used in generation prompts.
    virtual QString schema(bool includeSampleRows = false) const = 0;

    // Never throws for query errors; failures come back in the result.
    virtual QueryResult execute(const QString& query) const = 0;

    // User tables, sorted by name.
    virtual QStringList tableNames() const = 0;
};

} // namespace rc
