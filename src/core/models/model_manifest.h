#pragma once

#include <QJsonObject>
#include <QString>

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace mc {

// One model described by <modelsDir>/manifest.json, keyed by role
// (for example "bi-encoder").
struct ModelManifestEntry {
    QString name;
    QString file;
    QString vocab;
    QString modelId;
    int dimensions = 0;
    int maxSeqLength = 256;
    std::vector<QString> inputs;
    std::vector<QString> outputs;
    QString poolingStrategy = QStringLiteral("mean");   // "mean" or "cls"
    int intraOpThreads = 2;
};

struct ModelManifest {
    std::unordered_map<std::string, ModelManifestEntry> models;

    const ModelManifestEntry* find(const QString& role) const;

    static std::optional<ModelManifest> loadFromFile(const QString& path);
    static std::optional<ModelManifest> loadFromJson(const QJsonObject& root);
};

} // namespace mc
