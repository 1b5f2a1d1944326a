#pragma once

#include <QString>
#include <QStringList>

#include <optional>
#include <vector>

namespace rc {

// Evidence strategy chosen for a question.
enum class Route {
    Document,
    Structured,
    Hybrid,
};

QString routeToString(Route route);

// Accepts the canonical names plus the aliases a model tends to answer with
// ("rag", "docs", "sql"). Returns nullopt for anything else.
std::optional<Route> routeFromString(const QString& str);

// Expected shape of the final answer.
//
//   "int"                               -> Int
//   "float"                             -> Float
//   "{category:str, quantity:int}"      -> Object
//   "list[{product:str, revenue:float}]" -> List (of objects)
//   "list[int]"                         -> List (of scalars)
//   anything else                       -> Generic
struct FormatHint {
    enum class Kind {
        Int,
        Float,
        Object,
        List,
        Generic,
    };

    enum class FieldType {
        String,
        Int,
        Float,
        Any,
    };

    struct Field {
        QString name;
        FieldType type = FieldType::Any;
    };

    Kind kind = Kind::Generic;
    QString raw;

    // Object fields, or the element fields of a list of objects.
    std::vector<Field> fields;

    // Element type of a list of scalars (fields is empty in that case).
    FieldType elementType = FieldType::Any;

    static FormatHint parse(const QString& hint);
};

QString formatKindToString(FormatHint::Kind kind);

struct Question {
    QString text;
    FormatHint formatHint;
};

} // namespace rc
