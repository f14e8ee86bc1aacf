#include "core/shared/settings_manager.h"
#include "core/shared/logging.h"
#include "core/ranking/ranking_preset.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>

#include <cmath>

namespace nr {

namespace {

bool inUnitRange(double value)
{
    return std::isfinite(value) && value >= 0.0 && value <= 1.0;
}

void readDouble(const QJsonObject& json, const QString& key, double& target)
{
    if (json.value(key).isDouble()) {
        target = json.value(key).toDouble();
    }
}

void readInt(const QJsonObject& json, const QString& key, int& target)
{
    if (json.value(key).isDouble()) {
        target = json.value(key).toInt(target);
    }
}

} // namespace

std::optional<EngineSettings> SettingsManager::loadFromFile(const QString& filePath)
{
    QFile file(filePath);
    if (!file.exists()) {
        LOG_WARN(nrCore, "Settings file does not exist: %s", qUtf8Printable(filePath));
        return std::nullopt;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARN(nrCore, "Failed to open settings file for read: %s", qUtf8Printable(filePath));
        return std::nullopt;
    }

    const QByteArray rawJson = file.readAll();
    file.close();

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(rawJson, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_WARN(nrCore,
                 "Failed to parse settings JSON (%s): %s",
                 qUtf8Printable(filePath),
                 qUtf8Printable(parseError.errorString()));
        return std::nullopt;
    }

    return fromJson(doc.object());
}

bool SettingsManager::saveToFile(const EngineSettings& settings, const QString& filePath)
{
    const QFileInfo fileInfo(filePath);
    const QString parentDir = fileInfo.absolutePath();

    if (!QDir().mkpath(parentDir)) {
        LOG_ERROR(nrCore, "Failed to create settings directory: %s", qUtf8Printable(parentDir));
        return false;
    }

    const QJsonDocument doc(toJson(settings));
    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        LOG_ERROR(nrCore, "Failed to open settings file for write: %s", qUtf8Printable(filePath));
        return false;
    }

    const qint64 bytesWritten = file.write(doc.toJson(QJsonDocument::Indented));
    file.close();

    if (bytesWritten < 0) {
        LOG_ERROR(nrCore, "Failed to write settings file: %s", qUtf8Printable(filePath));
        return false;
    }

    return true;
}

QJsonObject SettingsManager::toJson(const EngineSettings& settings)
{
    QJsonObject json;
    json.insert(QStringLiteral("similarityThreshold"), settings.similarityThreshold);
    json.insert(QStringLiteral("corroborationThreshold"), settings.corroborationThreshold);
    json.insert(QStringLiteral("corroborationMinTitleTokens"), settings.corroborationMinTitleTokens);
    json.insert(QStringLiteral("freshnessHalfLifeHours"), settings.freshnessHalfLifeHours);
    json.insert(QStringLiteral("viewWeight"), settings.viewWeight);
    json.insert(QStringLiteral("shareWeight"), settings.shareWeight);
    json.insert(QStringLiteral("commentWeight"), settings.commentWeight);
    json.insert(QStringLiteral("velocityNormalization"), settings.velocityNormalization);
    json.insert(QStringLiteral("velocityMinHours"), settings.velocityMinHours);
    json.insert(QStringLiteral("integrityExcludeBelow"), settings.integrityExcludeBelow);
    json.insert(QStringLiteral("spamExcludeAbove"), settings.spamExcludeAbove);
    json.insert(QStringLiteral("credibilityFlagBelow"), settings.credibilityFlagBelow);
    json.insert(QStringLiteral("preset"), settings.presetName);
    json.insert(QStringLiteral("diversityCap"), settings.diversityCap);
    json.insert(QStringLiteral("limit"), settings.limit);
    json.insert(QStringLiteral("offset"), settings.offset);
    json.insert(QStringLiteral("workerThreads"), settings.workerThreads);

    if (!settings.customPresets.empty()) {
        QJsonArray presets;
        for (const RankingPreset& preset : settings.customPresets) {
            QJsonObject entry;
            entry.insert(QStringLiteral("name"), preset.name);
            entry.insert(QStringLiteral("popularity"), preset.popularity);
            entry.insert(QStringLiteral("relevance"), preset.relevance);
            entry.insert(QStringLiteral("quality"), preset.quality);
            entry.insert(QStringLiteral("credibility"), preset.credibility);
            presets.append(entry);
        }
        json.insert(QStringLiteral("presets"), presets);
    }

    if (settings.referenceTime.has_value()) {
        json.insert(QStringLiteral("referenceTime"),
                    settings.referenceTime->toUTC().toString(Qt::ISODate));
    }
    return json;
}

EngineSettings SettingsManager::fromJson(const QJsonObject& json)
{
    EngineSettings settings;

    readDouble(json, QStringLiteral("similarityThreshold"), settings.similarityThreshold);
    readDouble(json, QStringLiteral("corroborationThreshold"), settings.corroborationThreshold);
    readInt(json, QStringLiteral("corroborationMinTitleTokens"), settings.corroborationMinTitleTokens);
    readDouble(json, QStringLiteral("freshnessHalfLifeHours"), settings.freshnessHalfLifeHours);
    readDouble(json, QStringLiteral("viewWeight"), settings.viewWeight);
    readDouble(json, QStringLiteral("shareWeight"), settings.shareWeight);
    readDouble(json, QStringLiteral("commentWeight"), settings.commentWeight);
    readDouble(json, QStringLiteral("velocityNormalization"), settings.velocityNormalization);
    readDouble(json, QStringLiteral("velocityMinHours"), settings.velocityMinHours);
    readDouble(json, QStringLiteral("integrityExcludeBelow"), settings.integrityExcludeBelow);
    readDouble(json, QStringLiteral("spamExcludeAbove"), settings.spamExcludeAbove);
    readDouble(json, QStringLiteral("credibilityFlagBelow"), settings.credibilityFlagBelow);
    readInt(json, QStringLiteral("diversityCap"), settings.diversityCap);
    readInt(json, QStringLiteral("limit"), settings.limit);
    readInt(json, QStringLiteral("offset"), settings.offset);
    readInt(json, QStringLiteral("workerThreads"), settings.workerThreads);

    settings.presetName = json.value(QStringLiteral("preset")).toString(settings.presetName);

    const QJsonArray presetsArray = json.value(QStringLiteral("presets")).toArray();
    settings.customPresets.reserve(static_cast<size_t>(presetsArray.size()));
    for (const QJsonValue& value : presetsArray) {
        const QJsonObject entry = value.toObject();
        RankingPreset preset;
        preset.name = entry.value(QStringLiteral("name")).toString();
        preset.popularity = entry.value(QStringLiteral("popularity")).toDouble(0.0);
        preset.relevance = entry.value(QStringLiteral("relevance")).toDouble(0.0);
        preset.quality = entry.value(QStringLiteral("quality")).toDouble(0.0);
        preset.credibility = entry.value(QStringLiteral("credibility")).toDouble(0.0);
        settings.customPresets.push_back(preset);
    }

    const QString reference = json.value(QStringLiteral("referenceTime")).toString();
    if (!reference.isEmpty()) {
        const QDateTime dt = QDateTime::fromString(reference, Qt::ISODate);
        if (dt.isValid()) {
            settings.referenceTime = dt;
        } else {
            LOG_WARN(nrCore, "Ignoring unparseable referenceTime: %s", qUtf8Printable(reference));
        }
    }

    return settings;
}

std::optional<QString> SettingsManager::validateSettings(const EngineSettings& settings)
{
    if (!inUnitRange(settings.similarityThreshold)) {
        return QStringLiteral("similarityThreshold must be within [0,1], got %1")
            .arg(settings.similarityThreshold);
    }
    if (!inUnitRange(settings.corroborationThreshold)) {
        return QStringLiteral("corroborationThreshold must be within [0,1], got %1")
            .arg(settings.corroborationThreshold);
    }
    if (settings.corroborationMinTitleTokens < 0) {
        return QStringLiteral("corroborationMinTitleTokens must not be negative");
    }
    if (!(settings.freshnessHalfLifeHours > 0.0)) {
        return QStringLiteral("freshnessHalfLifeHours must be positive, got %1")
            .arg(settings.freshnessHalfLifeHours);
    }
    if (!inUnitRange(settings.viewWeight) || !inUnitRange(settings.shareWeight)
        || !inUnitRange(settings.commentWeight)) {
        return QStringLiteral("popularity sub-weights must be within [0,1]");
    }
    if (!(settings.velocityNormalization > 0.0)) {
        return QStringLiteral("velocityNormalization must be positive");
    }
    if (!(settings.velocityMinHours > 0.0)) {
        return QStringLiteral("velocityMinHours must be positive");
    }
    if (!inUnitRange(settings.integrityExcludeBelow) || !inUnitRange(settings.spamExcludeAbove)
        || !inUnitRange(settings.credibilityFlagBelow)) {
        return QStringLiteral("policy thresholds must be within [0,1]");
    }
    if (settings.diversityCap < 0) {
        return QStringLiteral("diversityCap must not be negative, got %1").arg(settings.diversityCap);
    }
    if (settings.limit < 0) {
        return QStringLiteral("limit must not be negative, got %1").arg(settings.limit);
    }
    if (settings.offset < 0) {
        return QStringLiteral("offset must not be negative, got %1").arg(settings.offset);
    }
    if (settings.workerThreads < 0) {
        return QStringLiteral("workerThreads must not be negative");
    }
    for (const RankingPreset& preset : settings.customPresets) {
        if (auto error = validatePreset(preset)) {
            return error;
        }
    }
    return std::nullopt;
}

} // namespace nr
