#include "core/shared/settings_manager.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QStandardPaths>

#include <algorithm>

namespace hq {

namespace {

constexpr int kMinQueryLengthLimit = 16;
constexpr int kMaxQueryLengthLimit = 100000;

} // namespace

std::optional<RouterSettings> SettingsManager::load(const QString& filePath)
{
    QFile file(filePath);
    if (!file.exists()) {
        return std::nullopt;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARN(hqCore, "Failed to open settings file for read: %s", qUtf8Printable(filePath));
        return std::nullopt;
    }

    const QByteArray rawJson = file.readAll();
    file.close();

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(rawJson, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_WARN(hqCore,
                 "Failed to parse settings JSON (%s): %s",
                 qUtf8Printable(filePath),
                 qUtf8Printable(parseError.errorString()));
        return std::nullopt;
    }

    return fromJson(doc.object());
}

bool SettingsManager::save(const RouterSettings& settings, const QString& filePath)
{
    const QFileInfo fileInfo(filePath);
    const QString parentDir = fileInfo.absolutePath();

    if (!QDir().mkpath(parentDir)) {
        LOG_ERROR(hqCore, "Failed to create settings directory: %s", qUtf8Printable(parentDir));
        return false;
    }

    const QJsonDocument doc(toJson(settings));
    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        LOG_ERROR(hqCore, "Failed to open settings file for write: %s", qUtf8Printable(filePath));
        return false;
    }

    const qint64 bytesWritten = file.write(doc.toJson(QJsonDocument::Indented));
    file.close();

    if (bytesWritten < 0) {
        LOG_ERROR(hqCore, "Failed to write settings file: %s", qUtf8Printable(filePath));
        return false;
    }

    return true;
}

QString SettingsManager::settingsFilePath()
{
    const QString basePath = QStandardPaths::writableLocation(QStandardPaths::GenericConfigLocation);
    return basePath + QStringLiteral("/helmquery/router.json");
}

QJsonObject SettingsManager::toJson(const RouterSettings& settings)
{
    QJsonObject json;
    json.insert(QStringLiteral("maxQueryLength"), settings.maxQueryLength);
    json.insert(QStringLiteral("pasteDumpMinLength"), settings.pasteDumpMinLength);
    json.insert(QStringLiteral("pasteDumpAlphaRatio"), settings.pasteDumpAlphaRatio);
    return json;
}

RouterSettings SettingsManager::fromJson(const QJsonObject& json)
{
    RouterSettings settings;

    if (json.contains(QStringLiteral("maxQueryLength"))) {
        settings.maxQueryLength = std::clamp(
            json.value(QStringLiteral("maxQueryLength")).toInt(settings.maxQueryLength),
            kMinQueryLengthLimit, kMaxQueryLengthLimit);
    }

    if (json.contains(QStringLiteral("pasteDumpMinLength"))) {
        settings.pasteDumpMinLength = std::max(
            1, json.value(QStringLiteral("pasteDumpMinLength")).toInt(settings.pasteDumpMinLength));
    }

    if (json.contains(QStringLiteral("pasteDumpAlphaRatio"))) {
        settings.pasteDumpAlphaRatio = std::clamp(
            json.value(QStringLiteral("pasteDumpAlphaRatio")).toDouble(settings.pasteDumpAlphaRatio),
            0.0, 1.0);
    }

    return settings;
}

} // namespace hq
