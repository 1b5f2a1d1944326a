#pragma once

#include "core/shared/run_state.h"
#include "core/shared/snippet.h"

#include <QString>
#include <vector>

namespace rc {

// ConstraintPlanner -- derives query constraints from the question text and
// the retrieved evidence using a fixed catalogue:
//
//   campaigns   "Summer Beverages 1997" (summer)  1997-06-01..1997-06-30
//               "Winter Classics 1997"  (winter)  1997-12-01..1997-12-31
//   categories  keyword -> Northwind category name
//   metrics     aov, margin, revenue -> SQL formula
//   year        four-digit year, only when no date range was derived
//   top_n       "top N"
//
// Campaigns are matched in the question first (full name or alias), then in
// the evidence text by full name.
class ConstraintPlanner {
public:
    Constraints plan(const QString& question, const std::vector<Snippet>& snippets) const;

    static QString formulaForMetric(const QString& metric);
};

} // namespace rc
