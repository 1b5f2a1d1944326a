#include "core/shared/types.h"

#include <QRegularExpression>

namespace rc {

namespace {

FormatHint::FieldType fieldTypeFromString(const QString& str)
{
    const QString lower = str.trimmed().toLower();
    if (lower == QLatin1String("str") || lower == QLatin1String("string")) {
        return FormatHint::FieldType::String;
    }
    if (lower == QLatin1String("int") || lower == QLatin1String("integer")) {
        return FormatHint::FieldType::Int;
    }
    if (lower == QLatin1String("float") || lower == QLatin1String("double")
        || lower == QLatin1String("number")) {
        return FormatHint::FieldType::Float;
    }
    return FormatHint::FieldType::Any;
}

// Parses "name:type, name:type" (braces already stripped).
std::vector<FormatHint::Field> parseFields(const QString& body)
{
    std::vector<FormatHint::Field> fields;
    const QStringList parts = body.split(QLatin1Char(','), Qt::SkipEmptyParts);
    for (const QString& part : parts) {
        const int colon = part.indexOf(QLatin1Char(':'));
        FormatHint::Field field;
        if (colon < 0) {
            field.name = part.trimmed();
        } else {
            field.name = part.left(colon).trimmed();
            field.type = fieldTypeFromString(part.mid(colon + 1));
        }
        field.name.remove(QLatin1Char('"'));
        field.name.remove(QLatin1Char('\''));
        if (!field.name.isEmpty()) {
            fields.push_back(field);
        }
    }
    return fields;
}

QString stripBraces(const QString& text)
{
    QString body = text.trimmed();
    if (body.startsWith(QLatin1Char('{'))) {
        body.remove(0, 1);
    }
    if (body.endsWith(QLatin1Char('}'))) {
        body.chop(1);
    }
    return body;
}

} // namespace

QString routeToString(Route route)
{
    switch (route) {
    case Route::Document:   return QStringLiteral("document");
    case Route::Structured: return QStringLiteral("structured");
    case Route::Hybrid:     return QStringLiteral("hybrid");
    }
    return QStringLiteral("structured");
}

std::optional<Route> routeFromString(const QString& str)
{
    const QString lower = str.trimmed().toLower();
    if (lower == QLatin1String("document") || lower == QLatin1String("rag")
        || lower == QLatin1String("docs")) {
        return Route::Document;
    }
    if (lower == QLatin1String("structured") || lower == QLatin1String("sql")) {
        return Route::Structured;
    }
    if (lower == QLatin1String("hybrid")) {
        return Route::Hybrid;
    }
    return std::nullopt;
}

QString formatKindToString(FormatHint::Kind kind)
{
    switch (kind) {
    case FormatHint::Kind::Int:     return QStringLiteral("int");
    case FormatHint::Kind::Float:   return QStringLiteral("float");
    case FormatHint::Kind::Object:  return QStringLiteral("object");
    case FormatHint::Kind::List:    return QStringLiteral("list");
    case FormatHint::Kind::Generic: return QStringLiteral("generic");
    }
    return QStringLiteral("generic");
}

FormatHint FormatHint::parse(const QString& hint)
{
    FormatHint result;
    result.raw = hint;
    const QString trimmed = hint.trimmed();
    const QString lower = trimmed.toLower();

    if (lower == QLatin1String("int") || lower == QLatin1String("integer")) {
        result.kind = Kind::Int;
        return result;
    }
    if (lower == QLatin1String("float") || lower == QLatin1String("double")) {
        result.kind = Kind::Float;
        return result;
    }
    if (trimmed.startsWith(QLatin1Char('{'))) {
        result.kind = Kind::Object;
        result.fields = parseFields(stripBraces(trimmed));
        return result;
    }

    if (lower.startsWith(QLatin1String("list"))) {
        result.kind = Kind::List;
        // "list[...]" or "list of ..."
        static const QRegularExpression listBody(
            QStringLiteral(R"(^list\s*(?:\[(.*)\]|of\s+(.*))$)"),
            QRegularExpression::CaseInsensitiveOption);
        const QRegularExpressionMatch m = listBody.match(trimmed);
        QString element;
        if (m.hasMatch()) {
            element = m.captured(1).isEmpty() ? m.captured(2) : m.captured(1);
        }
        element = element.trimmed();
        if (element.startsWith(QLatin1Char('{'))) {
            result.fields = parseFields(stripBraces(element));
        } else if (element.contains(QLatin1Char('+'))) {
            // "list of product+revenue"
            const QStringList names = element.split(QLatin1Char('+'), Qt::SkipEmptyParts);
            for (const QString& name : names) {
                result.fields.push_back({name.trimmed(), FieldType::Any});
            }
        } else {
            result.elementType = fieldTypeFromString(element);
        }
        return result;
    }

    // Shorthand object shape: "category+quantity"
    static const QRegularExpression plusShape(
        QStringLiteral(R"(^[A-Za-z_]\w*(\s*\+\s*[A-Za-z_]\w*)+$)"));
    if (plusShape.match(trimmed).hasMatch()) {
        result.kind = Kind::Object;
        const QStringList names = trimmed.split(QLatin1Char('+'), Qt::SkipEmptyParts);
        for (const QString& name : names) {
            result.fields.push_back({name.trimmed(), FieldType::Any});
        }
        return result;
    }

    return result;
}

} // namespace rc
