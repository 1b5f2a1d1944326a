#pragma once

#include <QJsonObject>
#include <QString>

#include <optional>

namespace rc {

// TextCleaner -- normalizes raw generation output before it is trusted.
//
// Models wrap answers in markdown fences, prefix them with labels, or embed
// the JSON object in chatter. Each helper undoes one of those habits and
// never fails: unusable input comes back empty (or nullopt).
class TextCleaner {
public:
    // Removes ```lang ... ``` fences, keeping the fenced body.
    static QString stripCodeFences(const QString& raw);

    // Query text from a completion:
    // 1. strip code fences
    // 2. unwrap {"sql": "..."} / {"query": "..."}
    // 3. drop a leading "sql:" label
    // 4. drop trailing semicolons and surrounding whitespace
    static QString cleanQuery(const QString& raw);

    // The last well-formed JSON object in the text. Bare keys such as
    // {route: "sql"} are quoted before parsing.
    static std::optional<QJsonObject> extractJsonObject(const QString& raw);

    // First word of the text, lower-cased, without quotes or punctuation.
    static QString normalizeLabel(const QString& raw);
};

} // namespace rc
