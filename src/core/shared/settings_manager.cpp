#include "core/shared/settings_manager.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QStandardPaths>

namespace tp {

namespace {

QString dataRoot()
{
    const QString basePath = QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation);
    return basePath + QStringLiteral("/thermopilot");
}

} // namespace

std::optional<EngineSettings> SettingsManager::load()
{
    return loadFrom(settingsFilePath());
}

std::optional<EngineSettings> SettingsManager::loadFrom(const QString& filePath)
{
    QFile file(filePath);
    if (!file.exists()) {
        return std::nullopt;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARN(tpCore, "Failed to open settings file for read: %s", qUtf8Printable(filePath));
        return std::nullopt;
    }

    const QByteArray rawJson = file.readAll();
    file.close();

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(rawJson, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_WARN(tpCore,
                 "Failed to parse settings JSON (%s): %s",
                 qUtf8Printable(filePath),
                 qUtf8Printable(parseError.errorString()));
        return std::nullopt;
    }

    return fromJson(doc.object());
}

bool SettingsManager::save(const EngineSettings& settings)
{
    return saveTo(settings, settingsFilePath());
}

bool SettingsManager::saveTo(const EngineSettings& settings, const QString& filePath)
{
    const QFileInfo fileInfo(filePath);
    const QString parentDir = fileInfo.absolutePath();

    if (!QDir().mkpath(parentDir)) {
        LOG_ERROR(tpCore, "Failed to create settings directory: %s", qUtf8Printable(parentDir));
        return false;
    }

    const QJsonDocument doc(toJson(settings));
    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        LOG_ERROR(tpCore, "Failed to open settings file for write: %s", qUtf8Printable(filePath));
        return false;
    }

    const qint64 bytesWritten = file.write(doc.toJson(QJsonDocument::Indented));
    file.close();

    if (bytesWritten < 0) {
        LOG_ERROR(tpCore, "Failed to write settings file: %s", qUtf8Printable(filePath));
        return false;
    }

    return true;
}

QString SettingsManager::settingsFilePath()
{
    const QString overridePath = qEnvironmentVariable("THERMOPILOT_SETTINGS").trimmed();
    if (!overridePath.isEmpty()) {
        return QDir::cleanPath(overridePath);
    }
    return dataRoot() + QStringLiteral("/settings.json");
}

QString SettingsManager::defaultDbPath()
{
    return QFileInfo(settingsFilePath()).absolutePath() + QStringLiteral("/learning.db");
}

QJsonObject SettingsManager::toJson(const EngineSettings& settings)
{
    QJsonObject learning;
    learning.insert(QStringLiteral("learningRate"), settings.learningRate);
    learning.insert(QStringLiteral("initialEpsilon"), settings.initialEpsilon);
    learning.insert(QStringLiteral("minEpsilon"), settings.minEpsilon);
    learning.insert(QStringLiteral("epsilonDecay"), settings.epsilonDecay);
    learning.insert(QStringLiteral("optimisticInitialValue"), settings.optimisticInitialValue);
    learning.insert(QStringLiteral("historyCapacity"), settings.historyCapacity);

    QJsonObject feedback;
    feedback.insert(QStringLiteral("monitoringWindowMs"),
                    static_cast<qint64>(settings.monitoringWindowMs));
    feedback.insert(QStringLiteral("sustainedReward"), settings.sustainedReward);
    feedback.insert(QStringLiteral("overrideReward"), settings.overrideReward);

    QJsonObject persistence;
    persistence.insert(QStringLiteral("maxSaveAttempts"), settings.maxSaveAttempts);
    persistence.insert(QStringLiteral("initialSaveBackoffMs"),
                       static_cast<qint64>(settings.initialSaveBackoffMs));
    persistence.insert(QStringLiteral("maxSaveBackoffMs"),
                       static_cast<qint64>(settings.maxSaveBackoffMs));

    QJsonObject activity;
    activity.insert(QStringLiteral("enabled"), settings.activityLogEnabled);
    activity.insert(QStringLiteral("retentionDays"), settings.activityRetentionDays);

    QJsonObject rooms;
    for (auto it = settings.roomCategories.cbegin(); it != settings.roomCategories.cend(); ++it) {
        rooms.insert(it.key(), it.value());
    }

    QJsonObject json;
    json.insert(QStringLiteral("dbPath"), settings.dbPath);
    json.insert(QStringLiteral("learning"), learning);
    json.insert(QStringLiteral("feedback"), feedback);
    json.insert(QStringLiteral("persistence"), persistence);
    json.insert(QStringLiteral("activityLog"), activity);
    json.insert(QStringLiteral("roomCategories"), rooms);
    json.insert(QStringLiteral("defaultRoomCategory"), settings.defaultRoomCategory);
    return json;
}

EngineSettings SettingsManager::fromJson(const QJsonObject& json)
{
    EngineSettings settings;

    settings.dbPath = json.value(QStringLiteral("dbPath")).toString(settings.dbPath);

    const QJsonObject learning = json.value(QStringLiteral("learning")).toObject();
    settings.learningRate = learning.value(QStringLiteral("learningRate"))
                                .toDouble(settings.learningRate);
    settings.initialEpsilon = learning.value(QStringLiteral("initialEpsilon"))
                                  .toDouble(settings.initialEpsilon);
    settings.minEpsilon = learning.value(QStringLiteral("minEpsilon"))
                              .toDouble(settings.minEpsilon);
    settings.epsilonDecay = learning.value(QStringLiteral("epsilonDecay"))
                                .toDouble(settings.epsilonDecay);
    settings.optimisticInitialValue = learning.value(QStringLiteral("optimisticInitialValue"))
                                          .toDouble(settings.optimisticInitialValue);
    settings.historyCapacity = learning.value(QStringLiteral("historyCapacity"))
                                   .toInt(settings.historyCapacity);

    const QJsonObject feedback = json.value(QStringLiteral("feedback")).toObject();
    if (feedback.contains(QStringLiteral("monitoringWindowMs"))) {
        settings.monitoringWindowMs = static_cast<int64_t>(
            feedback.value(QStringLiteral("monitoringWindowMs")).toVariant().toLongLong());
    }
    settings.sustainedReward = feedback.value(QStringLiteral("sustainedReward"))
                                   .toDouble(settings.sustainedReward);
    settings.overrideReward = feedback.value(QStringLiteral("overrideReward"))
                                  .toDouble(settings.overrideReward);

    const QJsonObject persistence = json.value(QStringLiteral("persistence")).toObject();
    settings.maxSaveAttempts = persistence.value(QStringLiteral("maxSaveAttempts"))
                                   .toInt(settings.maxSaveAttempts);
    if (persistence.contains(QStringLiteral("initialSaveBackoffMs"))) {
        settings.initialSaveBackoffMs = static_cast<int64_t>(
            persistence.value(QStringLiteral("initialSaveBackoffMs")).toVariant().toLongLong());
    }
    if (persistence.contains(QStringLiteral("maxSaveBackoffMs"))) {
        settings.maxSaveBackoffMs = static_cast<int64_t>(
            persistence.value(QStringLiteral("maxSaveBackoffMs")).toVariant().toLongLong());
    }

    const QJsonObject activity = json.value(QStringLiteral("activityLog")).toObject();
    settings.activityLogEnabled = activity.value(QStringLiteral("enabled"))
                                      .toBool(settings.activityLogEnabled);
    settings.activityRetentionDays = activity.value(QStringLiteral("retentionDays"))
                                         .toInt(settings.activityRetentionDays);

    const QJsonObject rooms = json.value(QStringLiteral("roomCategories")).toObject();
    settings.roomCategories.clear();
    for (auto it = rooms.constBegin(); it != rooms.constEnd(); ++it) {
        settings.roomCategories.insert(it.key(), it.value().toString());
    }

    settings.defaultRoomCategory = json.value(QStringLiteral("defaultRoomCategory"))
                                       .toString(settings.defaultRoomCategory);

    // Reject values that would break the learning contract.
    if (settings.learningRate <= 0.0 || settings.learningRate > 1.0) {
        LOG_WARN(tpCore, "Ignoring out-of-range learningRate %f", settings.learningRate);
        settings.learningRate = EngineSettings().learningRate;
    }
    if (settings.epsilonDecay <= 0.0 || settings.epsilonDecay > 1.0) {
        LOG_WARN(tpCore, "Ignoring out-of-range epsilonDecay %f", settings.epsilonDecay);
        settings.epsilonDecay = EngineSettings().epsilonDecay;
    }
    if (settings.historyCapacity < 1) {
        settings.historyCapacity = EngineSettings().historyCapacity;
    }
    if (settings.monitoringWindowMs <= 0) {
        settings.monitoringWindowMs = EngineSettings().monitoringWindowMs;
    }
    if (settings.maxSaveAttempts < 1) {
        settings.maxSaveAttempts = EngineSettings().maxSaveAttempts;
    }
    if (settings.activityRetentionDays < 1) {
        settings.activityRetentionDays = EngineSettings().activityRetentionDays;
    }

    return settings;
}

} // namespace tp
