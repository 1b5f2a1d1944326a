#pragma once

#include "core/shared/run_state.h"

#include <QString>

namespace rc {

// A constraint a template needs. `value` is used when the key is missing,
// empty, or rejected by `accepts` (null accepts any non-empty value).
struct ConstraintDefault {
    const char* key;
    const char* value;
    bool (*accepts)(const QString& value);
};

constexpr int kMaxTemplateDefaults = 3;

// One row of the prioritized template table. The last row is the delegate:
// it always matches, needs no constraints and has no render function.
// `render` receives constraints already resolved against `defaults`.
struct QueryTemplate {
    const char* name;
    bool (*matches)(const QString& lowerQuestion, const Constraints& constraints);
    QString (*render)(const Constraints& resolved);
    ConstraintDefault defaults[kMaxTemplateDefaults];
};

class QueryTemplateLibrary {
public:
    static constexpr const char* kDelegateName = "delegate";

    // First matching row; never null (the delegate always matches).
    static const QueryTemplate& match(const QString& question, const Constraints& constraints);

    static bool isDelegate(const QueryTemplate& entry);

    // Copy of `constraints` with every required key of `entry` filled in.
    static Constraints resolveConstraints(const QueryTemplate& entry,
                                          const Constraints& constraints);

    // Renders `entry` after resolving its constraints.
    static QString render(const QueryTemplate& entry, const Constraints& constraints);

    // Top products by quantity when the question asks for top products,
    // otherwise a count of orders.
    static QString safeFallbackQuery(const QString& question);

    // Doubles single quotes so the value can sit inside '...'.
    static QString escapeLiteral(const QString& value);
};

} // namespace rc
