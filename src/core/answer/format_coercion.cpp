#include "core/answer/format_coercion.h"

#include <QJsonArray>
#include <QJsonObject>

#include <algorithm>
#include <cmath>
#include <limits>

namespace rc {
namespace format_coercion {

namespace {

bool isEmptyCell(const QVariant& cell)
{
    if (!cell.isValid() || cell.isNull()) {
        return true;
    }
    return cell.typeId() == QMetaType::QString && cell.toString().isEmpty();
}

// Saturates outside the qint64 range; 2^63 is exact as a double.
qint64 truncateToInt(double value)
{
    if (!std::isfinite(value)) {
        return 0;
    }
    constexpr double kTwoPow63 = 9223372036854775808.0;
    const double truncated = std::trunc(value);
    if (truncated >= kTwoPow63) {
        return std::numeric_limits<qint64>::max();
    }
    if (truncated < -kTwoPow63) {
        return std::numeric_limits<qint64>::min();
    }
    return static_cast<qint64>(truncated);
}

QJsonValue rawCell(const QVariant& cell)
{
    if (isEmptyCell(cell)) {
        return QJsonValue(QJsonValue::Null);
    }
    return QJsonValue::fromVariant(cell);
}

QJsonValue roundedIfDouble(const QJsonValue& value)
{
    if (value.isDouble() && value.toDouble() != std::floor(value.toDouble())) {
        return round2(value.toDouble());
    }
    return value;
}

QJsonObject rowToObject(const FormatHint& hint, const QStringList& columns,
                        const QVariantList& row)
{
    QJsonObject obj;
    if (!hint.fields.empty()) {
        const size_t n = std::min(hint.fields.size(), static_cast<size_t>(row.size()));
        for (size_t i = 0; i < n; ++i) {
            const FormatHint::Field& field = hint.fields[i];
            obj.insert(field.name, coerceCell(row.at(static_cast<int>(i)), field.type));
        }
        return obj;
    }

    for (int i = 0; i < row.size(); ++i) {
        const QString name = i < columns.size() ? columns.at(i)
                                                : QStringLiteral("col%1").arg(i);
        obj.insert(name, roundedIfDouble(rawCell(row.at(i))));
    }
    return obj;
}

std::optional<QJsonValue> coerceJsonField(const QJsonValue& value, FormatHint::FieldType type)
{
    switch (type) {
    case FormatHint::FieldType::String:
        if (value.isString()) {
            return value;
        }
        if (value.isDouble()) {
            return QJsonValue(QString::number(value.toDouble()));
        }
        return std::nullopt;
    case FormatHint::FieldType::Int:
    case FormatHint::FieldType::Float: {
        double number = 0.0;
        if (value.isDouble()) {
            number = value.toDouble();
        } else if (value.isString()) {
            bool ok = false;
            number = value.toString().trimmed().toDouble(&ok);
            if (!ok) {
                return std::nullopt;
            }
        } else {
            return std::nullopt;
        }
        if (type == FormatHint::FieldType::Int) {
            return QJsonValue(truncateToInt(number));
        }
        return QJsonValue(round2(number));
    }
    case FormatHint::FieldType::Any:
        if (value.isUndefined()) {
            return std::nullopt;
        }
        return roundedIfDouble(value);
    }
    return std::nullopt;
}

std::optional<QJsonObject> coerceJsonObject(const FormatHint& hint, const QJsonValue& value)
{
    if (!value.isObject()) {
        return std::nullopt;
    }
    const QJsonObject input = value.toObject();
    if (hint.fields.empty()) {
        return input;
    }

    QJsonObject out;
    for (const FormatHint::Field& field : hint.fields) {
        const auto coerced = coerceJsonField(input.value(field.name), field.type);
        if (!coerced) {
            return std::nullopt;
        }
        out.insert(field.name, *coerced);
    }
    return out;
}

} // namespace

double round2(double value)
{
    return std::round(value * 100.0) / 100.0;
}

QJsonValue defaultValue(const FormatHint& hint)
{
    switch (hint.kind) {
    case FormatHint::Kind::Int:     return QJsonValue(0);
    case FormatHint::Kind::Float:   return QJsonValue(0.0);
    case FormatHint::Kind::Object:  return QJsonObject();
    case FormatHint::Kind::List:    return QJsonArray();
    case FormatHint::Kind::Generic: return QJsonValue(QJsonValue::Null);
    }
    return QJsonValue(QJsonValue::Null);
}

QJsonValue coerceCell(const QVariant& cell, FormatHint::FieldType type)
{
    switch (type) {
    case FormatHint::FieldType::String:
        return isEmptyCell(cell) ? QJsonValue(QString()) : QJsonValue(cell.toString());
    case FormatHint::FieldType::Int:
        return QJsonValue(isEmptyCell(cell) ? qint64(0) : truncateToInt(cell.toDouble()));
    case FormatHint::FieldType::Float:
        return QJsonValue(isEmptyCell(cell) ? 0.0 : round2(cell.toDouble()));
    case FormatHint::FieldType::Any:
        return rawCell(cell);
    }
    return rawCell(cell);
}

QJsonValue coerceRows(const FormatHint& hint,
                      const QStringList& columns,
                      const std::vector<QVariantList>& rows)
{
    if (rows.empty() || rows.front().isEmpty()) {
        return defaultValue(hint);
    }

    const QVariantList& first = rows.front();

    switch (hint.kind) {
    case FormatHint::Kind::Int:
        return coerceCell(first.at(0), FormatHint::FieldType::Int);
    case FormatHint::Kind::Float:
        return coerceCell(first.at(0), FormatHint::FieldType::Float);
    case FormatHint::Kind::Generic:
        return roundedIfDouble(rawCell(first.at(0)));
    case FormatHint::Kind::Object:
        if (isEmptyCell(first.at(0))) {
            return QJsonObject();
        }
        return rowToObject(hint, columns, first);
    case FormatHint::Kind::List: {
        QJsonArray list;
        for (const QVariantList& row : rows) {
            if (row.isEmpty() || isEmptyCell(row.at(0))) {
                continue;
            }
            if (!hint.fields.empty() || (hint.elementType == FormatHint::FieldType::Any
                                         && row.size() > 1)) {
                list.append(rowToObject(hint, columns, row));
            } else {
                list.append(coerceCell(row.at(0), hint.elementType));
            }
        }
        return list;
    }
    }
    return defaultValue(hint);
}

std::optional<QJsonValue> coerceJson(const FormatHint& hint, const QJsonValue& value)
{
    switch (hint.kind) {
    case FormatHint::Kind::Int:
        return coerceJsonField(value, FormatHint::FieldType::Int);
    case FormatHint::Kind::Float:
        return coerceJsonField(value, FormatHint::FieldType::Float);
    case FormatHint::Kind::Generic:
        return coerceJsonField(value, FormatHint::FieldType::Any);
    case FormatHint::Kind::Object:
        if (auto obj = coerceJsonObject(hint, value)) {
            return QJsonValue(*obj);
        }
        return std::nullopt;
    case FormatHint::Kind::List: {
        if (!value.isArray()) {
            return std::nullopt;
        }
        QJsonArray out;
        for (const QJsonValue& element : value.toArray()) {
            if (!hint.fields.empty()) {
                auto obj = coerceJsonObject(hint, element);
                if (!obj) {
                    return std::nullopt;
                }
                out.append(*obj);
            } else {
                auto scalar = coerceJsonField(element, hint.elementType);
                if (!scalar) {
                    return std::nullopt;
                }
                out.append(*scalar);
            }
        }
        return QJsonValue(out);
    }
    }
    return std::nullopt;
}

} // namespace format_coercion
} // namespace rc
