#pragma once

#include "core/shared/settings.h"

#include <QJsonObject>
#include <QString>

#include <optional>

namespace nr {

// SettingsManager -- JSON save/load for engine settings.
//
// Keys missing from a settings file keep their compiled-in defaults, so a
// partial file only overrides what it names.
class SettingsManager {
public:
    // Load settings from a JSON file. Returns nullopt if the file cannot be
    // read or parsed. The result is not validated; call validateSettings().
    static std::optional<EngineSettings> loadFromFile(const QString& filePath);

    // Save settings to a JSON file. Creates the parent directory if needed.
    // Returns true on success.
    static bool saveToFile(const EngineSettings& settings, const QString& filePath);

    // Convert settings to/from JSON.
    static QJsonObject toJson(const EngineSettings& settings);
    static EngineSettings fromJson(const QJsonObject& json);

    // Returns the first configuration error, or nullopt if the settings are
    // usable. Does not check that presetName resolves; that is reported
    // separately as an unknown preset.
    static std::optional<QString> validateSettings(const EngineSettings& settings);
};

} // namespace nr
