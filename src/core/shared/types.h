#pragma once

#include <QString>
#include <QStringList>

#include <cstdint>
#include <optional>

namespace mc {

// A single stored memory row. The primary store owns its lifecycle; the
// retrieval core only reads the text fields and writes `embedding`.
struct MemoryRecord {
    int64_t rowId = 0;
    QString id;
    QString projectId;
    QString key;
    QString content;
    QStringList tags;
    std::optional<QString> embedding;   // serialized (see Quantizer)
    int64_t revision = 1;
    std::optional<int64_t> embeddedRevision;
    std::optional<double> archivedAt;   // epoch seconds
    double createdAt = 0.0;
    double updatedAt = 0.0;

    bool isArchived() const { return archivedAt.has_value(); }
};

// Row as returned by the vector-scan query: only what similarity needs.
struct StoredEmbedding {
    QString id;
    QString embedding;
};

enum class WriteKind {
    Insert,
    Update,
    Delete,
};

QString writeKindToString(WriteKind kind);

// Text that represents a memory for embedding: key, content and tags joined
// by single spaces.
QString embeddingText(const MemoryRecord& record);
QString embeddingText(const QString& key, const QString& content, const QStringList& tags);

// Tags persist as a JSON array string in the `tags` column.
QString encodeTags(const QStringList& tags);
QStringList decodeTags(const QString& stored);

} // namespace mc
