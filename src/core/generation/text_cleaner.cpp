#include "core/generation/text_cleaner.h"

#include <QJsonDocument>
#include <QJsonParseError>
#include <QRegularExpression>

namespace rc {

namespace {

std::optional<QJsonObject> parseObject(const QString& text)
{
    QJsonParseError error;
    const QJsonDocument doc = QJsonDocument::fromJson(text.toUtf8(), &error);
    if (error.error != QJsonParseError::NoError || !doc.isObject()) {
        return std::nullopt;
    }
    return doc.object();
}

// The whole text as an object, else the last balanced {...} span that parses.
std::optional<QJsonObject> lastObjectIn(const QString& text)
{
    if (auto whole = parseObject(text)) {
        return whole;
    }

    std::optional<QJsonObject> last;
    int depth = 0;
    int start = -1;
    bool inString = false;
    for (int i = 0; i < text.size(); ++i) {
        const QChar ch = text.at(i);
        if (inString) {
            if (ch == QLatin1Char('\\')) {
                ++i;
            } else if (ch == QLatin1Char('"')) {
                inString = false;
            }
            continue;
        }
        if (ch == QLatin1Char('"')) {
            inString = true;
        } else if (ch == QLatin1Char('{')) {
            if (depth == 0) {
                start = i;
            }
            ++depth;
        } else if (ch == QLatin1Char('}') && depth > 0) {
            --depth;
            if (depth == 0 && start >= 0) {
                if (auto candidate = parseObject(text.mid(start, i - start + 1))) {
                    last = std::move(candidate);
                }
                start = -1;
            }
        }
    }
    return last;
}

} // namespace

QString TextCleaner::stripCodeFences(const QString& raw)
{
    static const QRegularExpression fenced(
        QStringLiteral("```[A-Za-z]*\\s*([\\s\\S]*?)```"));
    QString result = raw;
    result.replace(fenced, QStringLiteral("\\1"));
    // An unterminated opening fence
    static const QRegularExpression dangling(QStringLiteral("```[A-Za-z]*"));
    result.remove(dangling);
    return result.trimmed();
}

QString TextCleaner::cleanQuery(const QString& raw)
{
    QString text = stripCodeFences(raw);

    if (text.startsWith(QLatin1Char('{'))) {
        if (const auto obj = extractJsonObject(text)) {
            for (const QString& key : {QStringLiteral("sql"), QStringLiteral("query")}) {
                const QJsonValue value = obj->value(key);
                if (value.isString()) {
                    text = value.toString().trimmed();
                    break;
                }
            }
        }
    }

    static const QRegularExpression label(QStringLiteral("^sql\\s*:\\s*"),
                                          QRegularExpression::CaseInsensitiveOption);
    text.remove(label);

    text = text.trimmed();
    while (text.endsWith(QLatin1Char(';'))) {
        text.chop(1);
        text = text.trimmed();
    }
    return text;
}

std::optional<QJsonObject> TextCleaner::extractJsonObject(const QString& raw)
{
    const QString text = stripCodeFences(raw);
    if (auto found = lastObjectIn(text)) {
        return found;
    }

    static const QRegularExpression bareKey(QStringLiteral("([{,]\\s*)([A-Za-z_]\\w*)\\s*:"));
    QString quoted = text;
    quoted.replace(bareKey, QStringLiteral("\\1\"\\2\":"));
    if (quoted == text) {
        return std::nullopt;
    }
    return lastObjectIn(quoted);
}

QString TextCleaner::normalizeLabel(const QString& raw)
{
    static const QRegularExpression word(QStringLiteral("[A-Za-z_]+"));
    const QRegularExpressionMatch m = word.match(stripCodeFences(raw));
    return m.hasMatch() ? m.captured(0).toLower() : QString();
}

} // namespace rc
