#include "core/shared/types.h"

#include <QJsonArray>
#include <QJsonDocument>

namespace mc {

QString writeKindToString(WriteKind kind)
{
    switch (kind) {
    case WriteKind::Insert: return QStringLiteral("insert");
    case WriteKind::Update: return QStringLiteral("update");
    case WriteKind::Delete: return QStringLiteral("delete");
    }
    return QStringLiteral("unknown");
}

QString embeddingText(const MemoryRecord& record)
{
    return embeddingText(record.key, record.content, record.tags);
}

QString embeddingText(const QString& key, const QString& content, const QStringList& tags)
{
    return key + QLatin1Char(' ') + content + QLatin1Char(' ') + tags.join(QLatin1Char(' '));
}

QString encodeTags(const QStringList& tags)
{
    const QJsonDocument doc(QJsonArray::fromStringList(tags));
    return QString::fromUtf8(doc.toJson(QJsonDocument::Compact));
}

QStringList decodeTags(const QString& stored)
{
    if (stored.trimmed().isEmpty()) {
        return {};
    }

    const QJsonDocument doc = QJsonDocument::fromJson(stored.toUtf8());
    if (!doc.isArray()) {
        // Older rows may carry a plain comma separated list.
        QStringList tags = stored.split(QLatin1Char(','), Qt::SkipEmptyParts);
        for (QString& tag : tags) {
            tag = tag.trimmed();
        }
        tags.removeAll(QString());
        return tags;
    }

    QStringList tags;
    for (const QJsonValue& value : doc.array()) {
        if (value.isString() && !value.toString().isEmpty()) {
            tags.append(value.toString());
        }
    }
    return tags;
}

} // namespace mc
