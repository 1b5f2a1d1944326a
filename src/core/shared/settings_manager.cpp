#include "core/shared/settings_manager.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QStandardPaths>

#include <algorithm>

namespace rc {

QString strategyModeToString(StrategyMode mode)
{
    switch (mode) {
    case StrategyMode::Model: return QStringLiteral("model");
    case StrategyMode::Rules: return QStringLiteral("rules");
    }
    return QStringLiteral("rules");
}

StrategyMode strategyModeFromString(const QString& str, StrategyMode fallback)
{
    const QString lower = str.trimmed().toLower();
    if (lower == QLatin1String("model")) return StrategyMode::Model;
    if (lower == QLatin1String("rules")) return StrategyMode::Rules;
    return fallback;
}

std::optional<Settings> SettingsManager::load(const QString& filePath)
{
    QFile file(filePath);
    if (!file.exists()) {
        return std::nullopt;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARN(rcCore, "Failed to open settings file for read: %s", qUtf8Printable(filePath));
        return std::nullopt;
    }

    const QByteArray rawJson = file.readAll();
    file.close();

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(rawJson, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_WARN(rcCore,
                 "Failed to parse settings JSON (%s): %s",
                 qUtf8Printable(filePath),
                 qUtf8Printable(parseError.errorString()));
        return std::nullopt;
    }

    return fromJson(doc.object());
}

bool SettingsManager::save(const Settings& settings, const QString& filePath)
{
    const QFileInfo fileInfo(filePath);
    const QString parentDir = fileInfo.absolutePath();

    if (!QDir().mkpath(parentDir)) {
        LOG_ERROR(rcCore, "Failed to create settings directory: %s", qUtf8Printable(parentDir));
        return false;
    }

    const QJsonDocument doc(toJson(settings));
    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        LOG_ERROR(rcCore, "Failed to open settings file for write: %s", qUtf8Printable(filePath));
        return false;
    }

    const qint64 bytesWritten = file.write(doc.toJson(QJsonDocument::Indented));
    file.close();

    if (bytesWritten < 0) {
        LOG_ERROR(rcCore, "Failed to write settings file: %s", qUtf8Printable(filePath));
        return false;
    }

    return true;
}

QString SettingsManager::settingsFilePath()
{
    const QString basePath = QStandardPaths::writableLocation(QStandardPaths::GenericConfigLocation);
    return basePath + QStringLiteral("/retailcopilot/settings.json");
}

QJsonObject SettingsManager::toJson(const Settings& settings)
{
    QJsonObject generation;
    generation.insert(QStringLiteral("enabled"), settings.generation.enabled);
    generation.insert(QStringLiteral("endpoint"), settings.generation.endpoint);
    generation.insert(QStringLiteral("model"), settings.generation.model);
    generation.insert(QStringLiteral("timeoutMs"), settings.generation.timeoutMs);
    generation.insert(QStringLiteral("temperature"), settings.generation.temperature);
    generation.insert(QStringLiteral("maxTokens"), settings.generation.maxTokens);

    QJsonObject json;
    json.insert(QStringLiteral("docsDir"), settings.docsDir);
    json.insert(QStringLiteral("dbPath"), settings.dbPath);
    json.insert(QStringLiteral("generation"), generation);
    json.insert(QStringLiteral("routingMode"), strategyModeToString(settings.routingMode));
    json.insert(QStringLiteral("draftingMode"), strategyModeToString(settings.draftingMode));
    json.insert(QStringLiteral("answerMode"), strategyModeToString(settings.answerMode));
    json.insert(QStringLiteral("retrievalTopK"), settings.retrievalTopK);
    json.insert(QStringLiteral("minRelevance"), settings.minRelevance);
    json.insert(QStringLiteral("chunkSize"), settings.chunkSize);
    json.insert(QStringLiteral("maxRepairs"), settings.maxRepairs);
    json.insert(QStringLiteral("repairBypassesTemplates"), settings.repairBypassesTemplates);
    json.insert(QStringLiteral("explanationMaxChars"), settings.explanationMaxChars);
    return json;
}

Settings SettingsManager::fromJson(const QJsonObject& json)
{
    Settings settings;

    settings.docsDir = json.value(QStringLiteral("docsDir")).toString(settings.docsDir);
    settings.dbPath = json.value(QStringLiteral("dbPath")).toString(settings.dbPath);

    const QJsonObject generation = json.value(QStringLiteral("generation")).toObject();
    GenerationSettings& gen = settings.generation;
    gen.enabled = generation.value(QStringLiteral("enabled")).toBool(gen.enabled);
    gen.endpoint = generation.value(QStringLiteral("endpoint")).toString(gen.endpoint);
    gen.model = generation.value(QStringLiteral("model")).toString(gen.model);
    gen.timeoutMs = generation.value(QStringLiteral("timeoutMs")).toInt(gen.timeoutMs);
    gen.temperature = generation.value(QStringLiteral("temperature")).toDouble(gen.temperature);
    gen.maxTokens = generation.value(QStringLiteral("maxTokens")).toInt(gen.maxTokens);

    settings.routingMode = strategyModeFromString(
        json.value(QStringLiteral("routingMode")).toString(), settings.routingMode);
    settings.draftingMode = strategyModeFromString(
        json.value(QStringLiteral("draftingMode")).toString(), settings.draftingMode);
    settings.answerMode = strategyModeFromString(
        json.value(QStringLiteral("answerMode")).toString(), settings.answerMode);

    settings.retrievalTopK = json.value(QStringLiteral("retrievalTopK")).toInt(settings.retrievalTopK);
    settings.minRelevance = json.value(QStringLiteral("minRelevance")).toDouble(settings.minRelevance);
    settings.chunkSize = json.value(QStringLiteral("chunkSize")).toInt(settings.chunkSize);

    if (json.contains(QStringLiteral("maxRepairs"))) {
        settings.maxRepairs = std::max(0, json.value(QStringLiteral("maxRepairs")).toInt());
    }
    settings.repairBypassesTemplates = json.value(QStringLiteral("repairBypassesTemplates"))
                                           .toBool(settings.repairBypassesTemplates);
    settings.explanationMaxChars = json.value(QStringLiteral("explanationMaxChars"))
                                       .toInt(settings.explanationMaxChars);

    return settings;
}

} // namespace rc
