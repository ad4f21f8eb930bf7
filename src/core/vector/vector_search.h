#pragma once

#include <QString>
#include <QStringList>

#include <optional>
#include <vector>

namespace mc {

class EmbeddingProvider;
class MemoryStore;

struct SemanticMatch {
    QString id;
    float similarity = 0.0f;
};

// Brute-force cosine scan over a project's stored embeddings.
class VectorSearch {
public:
    static constexpr float kDefaultSimilarityFloor = 0.3f;

    VectorSearch(MemoryStore* store,
                 EmbeddingProvider* provider,
                 float similarityFloor = kDefaultSimilarityFloor);

    // dot(a, b) / (|a| |b|). 0 for empty or mismatched lengths and zero norms.
    static float cosineSimilarity(const std::vector<float>& a, const std::vector<float>& b);

    // nullopt when the query cannot be embedded; an empty list is a real
    // "nothing similar enough" answer.
    std::optional<QStringList> search(const QString& projectId, const QString& query, int limit);
    std::optional<std::vector<SemanticMatch>> searchScored(const QString& projectId,
                                                           const QString& query,
                                                           int limit);

    // Matches strictly above the floor, most similar first. Rows whose stored
    // embedding does not decode are skipped.
    std::vector<SemanticMatch> searchByEmbedding(const QString& projectId,
                                                 const std::vector<float>& queryEmbedding,
                                                 int limit,
                                                 const QString& excludeId = {});

    float similarityFloor() const { return m_similarityFloor; }

    static QStringList ids(const std::vector<SemanticMatch>& matches);

private:
    MemoryStore* m_store = nullptr;
    EmbeddingProvider* m_provider = nullptr;
    float m_similarityFloor = kDefaultSimilarityFloor;
};

} // namespace mc
