#pragma once

#include "core/shared/types.h"

#include <QJsonValue>
#include <QStringList>
#include <QVariant>
#include <QVariantList>

#include <optional>
#include <vector>

namespace rc {

// Converts raw values into the shape a FormatHint asks for.
namespace format_coercion {

double round2(double value);

// Zero value for the hint: 0, 0.0, {}, [] or null.
QJsonValue defaultValue(const FormatHint& hint);

QJsonValue coerceCell(const QVariant& cell, FormatHint::FieldType type);

// int / float / generic: first cell of the first row.
// object: first row, fields in column order ({} when the first cell is empty).
// list: every row whose first cell is not empty.
// No rows gives defaultValue().
QJsonValue coerceRows(const FormatHint& hint,
                      const QStringList& columns,
                      const std::vector<QVariantList>& rows);

// Coerces an already-structured value (e.g. parsed model output). Returns
// nullopt when the value cannot take the hinted shape.
std::optional<QJsonValue> coerceJson(const FormatHint& hint, const QJsonValue& value);

} // namespace format_coercion

} // namespace rc
