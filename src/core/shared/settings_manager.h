#pragma once

#include "core/shared/settings.h"

#include <QJsonObject>
#include <QString>

#include <optional>

namespace mc {

// SettingsManager -- JSON save/load for engine settings.
//
// Settings are stored as a JSON file at:
//   $MEMCTL_SETTINGS_PATH, or
//   <GenericDataLocation>/memctl/settings.json
class SettingsManager {
public:
    // Load settings from the default path. Returns nullopt if the file
    // doesn't exist or cannot be parsed.
    static std::optional<EngineSettings> load();
    static std::optional<EngineSettings> loadFromFile(const QString& filePath);

    // Load settings, falling back to defaults, then apply environment
    // overrides (MEMCTL_MODELS_DIR).
    static EngineSettings loadOrDefault();

    // Save settings to disk. Creates the directory if it doesn't exist.
    static bool save(const EngineSettings& settings);
    static bool saveToFile(const EngineSettings& settings, const QString& filePath);

    static QString settingsFilePath();
    static QString defaultDbPath();

    static QJsonObject toJson(const EngineSettings& settings);
    static EngineSettings fromJson(const QJsonObject& json);
};

} // namespace mc
