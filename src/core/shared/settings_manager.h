#pragma once

#include "core/shared/settings.h"

#include <QJsonObject>
#include <QString>

#include <optional>

namespace tp {

// SettingsManager -- JSON save/load for engine settings.
//
// The default location is $THERMOPILOT_SETTINGS when set, otherwise
//   <GenericDataLocation>/thermopilot/settings.json
class SettingsManager {
public:
    // Load settings from the default path. Returns nullopt if the file
    // doesn't exist or cannot be parsed.
    static std::optional<EngineSettings> load();
    static std::optional<EngineSettings> loadFrom(const QString& filePath);

    // Save settings. Creates the directory if it doesn't exist.
    static bool save(const EngineSettings& settings);
    static bool saveTo(const EngineSettings& settings, const QString& filePath);

    static QString settingsFilePath();

    // Default database location next to the settings file.
    static QString defaultDbPath();

    static QJsonObject toJson(const EngineSettings& settings);
    static EngineSettings fromJson(const QJsonObject& json);
};

} // namespace tp
