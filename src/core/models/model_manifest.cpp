#include "core/models/model_manifest.h"

#include "core/shared/logging.h"

#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>

namespace mc {

static std::optional<ModelManifestEntry> parseEntry(const QJsonObject& obj)
{
    if (!obj.contains(QStringLiteral("name")) || !obj.contains(QStringLiteral("file"))) {
        return std::nullopt;
    }

    ModelManifestEntry entry;
    entry.name = obj.value(QStringLiteral("name")).toString();
    entry.file = obj.value(QStringLiteral("file")).toString();
    entry.vocab = obj.value(QStringLiteral("vocab")).toString(QStringLiteral("vocab.txt"));
    entry.modelId = obj.value(QStringLiteral("modelId")).toString(entry.name);
    entry.dimensions = obj.value(QStringLiteral("dimensions")).toInt(0);
    entry.maxSeqLength = obj.value(QStringLiteral("maxSeqLength")).toInt(256);
    entry.poolingStrategy = obj.value(QStringLiteral("poolingStrategy"))
                                .toString(QStringLiteral("mean")).trimmed().toLower();
    entry.intraOpThreads = obj.value(QStringLiteral("intraOpThreads")).toInt(2);

    const QJsonArray inputsArray = obj.value(QStringLiteral("inputs")).toArray();
    entry.inputs.reserve(static_cast<size_t>(inputsArray.size()));
    for (const QJsonValue& v : inputsArray) {
        entry.inputs.push_back(v.toString());
    }

    const QJsonArray outputsArray = obj.value(QStringLiteral("outputs")).toArray();
    entry.outputs.reserve(static_cast<size_t>(outputsArray.size()));
    for (const QJsonValue& v : outputsArray) {
        entry.outputs.push_back(v.toString());
    }

    return entry;
}

const ModelManifestEntry* ModelManifest::find(const QString& role) const
{
    const auto it = models.find(role.toStdString());
    return it == models.end() ? nullptr : &it->second;
}

std::optional<ModelManifest> ModelManifest::loadFromFile(const QString& path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARN(mcEmbedding, "ModelManifest: cannot open %s", qPrintable(path));
        return std::nullopt;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        LOG_WARN(mcEmbedding, "ModelManifest: JSON parse error in %s: %s",
                 qPrintable(path), qPrintable(parseError.errorString()));
        return std::nullopt;
    }

    if (!doc.isObject()) {
        LOG_WARN(mcEmbedding, "ModelManifest: root is not a JSON object in %s", qPrintable(path));
        return std::nullopt;
    }

    return loadFromJson(doc.object());
}

std::optional<ModelManifest> ModelManifest::loadFromJson(const QJsonObject& root)
{
    const QJsonValue modelsValue = root.value(QStringLiteral("models"));
    if (!modelsValue.isObject()) {
        LOG_WARN(mcEmbedding, "ModelManifest: missing or invalid 'models' key");
        return std::nullopt;
    }

    const QJsonObject modelsObj = modelsValue.toObject();
    ModelManifest manifest;

    for (auto it = modelsObj.begin(); it != modelsObj.end(); ++it) {
        if (!it.value().isObject()) {
            LOG_WARN(mcEmbedding, "ModelManifest: entry '%s' is not an object, skipping",
                     qPrintable(it.key()));
            continue;
        }

        std::optional<ModelManifestEntry> entry = parseEntry(it.value().toObject());
        if (!entry.has_value()) {
            LOG_WARN(mcEmbedding, "ModelManifest: entry '%s' missing required fields, skipping",
                     qPrintable(it.key()));
            continue;
        }

        manifest.models[it.key().toStdString()] = std::move(entry.value());
    }

    return manifest;
}

} // namespace mc
