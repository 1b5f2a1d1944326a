#pragma once

#include "core/shared/settings.h"

#include <QJsonObject>
#include <QString>

#include <optional>

namespace rc {

// SettingsManager -- JSON save/load for copilot settings.
//
// Without an explicit path the file lives at:
//   <GenericConfigLocation>/retailcopilot/settings.json
// Keys missing from the file keep their Settings defaults.
class SettingsManager {
public:
    // Load settings from disk. Returns nullopt if the file doesn't exist
    // or cannot be parsed.
    static std::optional<Settings> load(const QString& filePath = settingsFilePath());

    // Save settings to disk. Creates the directory if it doesn't exist.
    static bool save(const Settings& settings, const QString& filePath = settingsFilePath());

    static QString settingsFilePath();

    static QJsonObject toJson(const Settings& settings);
    static Settings fromJson(const QJsonObject& json);
};

} // namespace rc
