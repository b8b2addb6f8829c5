#pragma once

#include "core/shared/settings.h"

#include <QJsonObject>
#include <QString>

#include <optional>

namespace hq {

// SettingsManager -- JSON save/load for router settings.
//
// The default file lives at:
//   <GenericConfigLocation>/helmquery/router.json
// Values outside their valid range are clamped on load.
class SettingsManager {
public:
    // Load settings from `filePath`. Returns nullopt if the file doesn't
    // exist or cannot be parsed.
    static std::optional<RouterSettings> load(const QString& filePath);

    // Save settings to `filePath`. Creates the directory if it doesn't exist.
    // Returns true on success.
    static bool save(const RouterSettings& settings, const QString& filePath);

    static QString settingsFilePath();

    static QJsonObject toJson(const RouterSettings& settings);
    static RouterSettings fromJson(const QJsonObject& json);
};

} // namespace hq
