#include "core/shared/settings_manager.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QProcessEnvironment>
#include <QStandardPaths>

#include <algorithm>

namespace mc {

namespace {

QString dataDir()
{
    const QString basePath = QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation);
    return basePath + QStringLiteral("/memctl");
}

} // namespace

std::optional<EngineSettings> SettingsManager::load()
{
    return loadFromFile(settingsFilePath());
}

std::optional<EngineSettings> SettingsManager::loadFromFile(const QString& filePath)
{
    QFile file(filePath);
    if (!file.exists()) {
        return std::nullopt;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARN(mcCore, "Failed to open settings file for read: %s", qUtf8Printable(filePath));
        return std::nullopt;
    }

    const QByteArray rawJson = file.readAll();
    file.close();

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(rawJson, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_WARN(mcCore,
                 "Failed to parse settings JSON (%s): %s",
                 qUtf8Printable(filePath),
                 qUtf8Printable(parseError.errorString()));
        return std::nullopt;
    }

    return fromJson(doc.object());
}

EngineSettings SettingsManager::loadOrDefault()
{
    EngineSettings settings = load().value_or(EngineSettings{});
    if (settings.dbPath.isEmpty()) {
        settings.dbPath = defaultDbPath();
    }

    const QProcessEnvironment env = QProcessEnvironment::systemEnvironment();
    const QString modelsOverride = env.value(QStringLiteral("MEMCTL_MODELS_DIR"));
    if (!modelsOverride.isEmpty()) {
        settings.modelsDir = QDir::cleanPath(modelsOverride);
    }
    if (settings.modelsDir.isEmpty()) {
        settings.modelsDir = dataDir() + QStringLiteral("/models");
    }
    return settings;
}

bool SettingsManager::save(const EngineSettings& settings)
{
    return saveToFile(settings, settingsFilePath());
}

bool SettingsManager::saveToFile(const EngineSettings& settings, const QString& filePath)
{
    const QFileInfo fileInfo(filePath);
    const QString parentDir = fileInfo.absolutePath();

    if (!QDir().mkpath(parentDir)) {
        LOG_ERROR(mcCore, "Failed to create settings directory: %s", qUtf8Printable(parentDir));
        return false;
    }

    const QJsonDocument doc(toJson(settings));
    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        LOG_ERROR(mcCore, "Failed to open settings file for write: %s", qUtf8Printable(filePath));
        return false;
    }

    const qint64 bytesWritten = file.write(doc.toJson(QJsonDocument::Indented));
    file.close();

    if (bytesWritten < 0) {
        LOG_ERROR(mcCore, "Failed to write settings file: %s", qUtf8Printable(filePath));
        return false;
    }

    return true;
}

QString SettingsManager::settingsFilePath()
{
    const QString envPath = QProcessEnvironment::systemEnvironment()
                                .value(QStringLiteral("MEMCTL_SETTINGS_PATH"));
    if (!envPath.isEmpty()) {
        return envPath;
    }
    return dataDir() + QStringLiteral("/settings.json");
}

QString SettingsManager::defaultDbPath()
{
    return dataDir() + QStringLiteral("/memctl.db");
}

QJsonObject SettingsManager::toJson(const EngineSettings& settings)
{
    QJsonObject json;
    json.insert(QStringLiteral("dbPath"), settings.dbPath);
    json.insert(QStringLiteral("modelsDir"), settings.modelsDir);
    json.insert(QStringLiteral("embeddingModelRole"), settings.embeddingModelRole);
    json.insert(QStringLiteral("embeddingEnabled"), settings.embeddingEnabled);
    json.insert(QStringLiteral("embeddingDimensions"), settings.embeddingDimensions);
    json.insert(QStringLiteral("embeddingQueueCapacity"), settings.embeddingQueueCapacity);
    json.insert(QStringLiteral("similarityFloor"), static_cast<double>(settings.similarityFloor));
    json.insert(QStringLiteral("rrfK"), settings.rrfK);
    json.insert(QStringLiteral("backfillIntervalMs"), static_cast<qint64>(settings.backfillIntervalMs));
    json.insert(QStringLiteral("backfillBatchLimit"), settings.backfillBatchLimit);
    json.insert(QStringLiteral("backfillSubBatchSize"), settings.backfillSubBatchSize);
    return json;
}

EngineSettings SettingsManager::fromJson(const QJsonObject& json)
{
    EngineSettings settings;

    settings.dbPath = json.value(QStringLiteral("dbPath")).toString(settings.dbPath);
    settings.modelsDir = json.value(QStringLiteral("modelsDir")).toString(settings.modelsDir);
    settings.embeddingModelRole = json.value(QStringLiteral("embeddingModelRole"))
                                      .toString(settings.embeddingModelRole);
    settings.embeddingEnabled = json.value(QStringLiteral("embeddingEnabled"))
                                    .toBool(settings.embeddingEnabled);

    if (json.contains(QStringLiteral("embeddingDimensions"))) {
        settings.embeddingDimensions = std::max(
            1, json.value(QStringLiteral("embeddingDimensions")).toInt(settings.embeddingDimensions));
    }

    if (json.contains(QStringLiteral("embeddingQueueCapacity"))) {
        settings.embeddingQueueCapacity = std::max(
            1, json.value(QStringLiteral("embeddingQueueCapacity")).toInt(settings.embeddingQueueCapacity));
    }

    if (json.contains(QStringLiteral("similarityFloor"))) {
        settings.similarityFloor = static_cast<float>(
            json.value(QStringLiteral("similarityFloor")).toDouble(settings.similarityFloor));
    }

    if (json.contains(QStringLiteral("rrfK"))) {
        settings.rrfK = std::max(0, json.value(QStringLiteral("rrfK")).toInt(settings.rrfK));
    }

    if (json.contains(QStringLiteral("backfillIntervalMs"))) {
        settings.backfillIntervalMs = std::max<int64_t>(
            1000,
            json.value(QStringLiteral("backfillIntervalMs")).toVariant().toLongLong());
    }

    if (json.contains(QStringLiteral("backfillBatchLimit"))) {
        settings.backfillBatchLimit = std::max(
            1, json.value(QStringLiteral("backfillBatchLimit")).toInt(settings.backfillBatchLimit));
    }

    if (json.contains(QStringLiteral("backfillSubBatchSize"))) {
        settings.backfillSubBatchSize = std::max(
            1, json.value(QStringLiteral("backfillSubBatchSize")).toInt(settings.backfillSubBatchSize));
    }

    return settings;
}

} // namespace mc
