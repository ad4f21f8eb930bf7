#include "core/vector/vector_search.h"
#include "core/embedding/embedding_provider.h"
#include "core/embedding/quantizer.h"
#include "core/index/memory_store.h"
#include "core/shared/logging.h"

#include <algorithm>
#include <cmath>

namespace mc {

VectorSearch::VectorSearch(MemoryStore* store, EmbeddingProvider* provider, float similarityFloor)
    : m_store(store)
    , m_provider(provider)
    , m_similarityFloor(similarityFloor)
{
}

float VectorSearch::cosineSimilarity(const std::vector<float>& a, const std::vector<float>& b)
{
    if (a.empty() || a.size() != b.size()) {
        return 0.0f;
    }

    double dot = 0.0;
    double normA = 0.0;
    double normB = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        dot += static_cast<double>(a[i]) * static_cast<double>(b[i]);
        normA += static_cast<double>(a[i]) * static_cast<double>(a[i]);
        normB += static_cast<double>(b[i]) * static_cast<double>(b[i]);
    }

    if (normA <= 0.0 || normB <= 0.0) {
        return 0.0f;
    }
    const double similarity = dot / (std::sqrt(normA) * std::sqrt(normB));
    if (!std::isfinite(similarity)) {
        return 0.0f;
    }
    return static_cast<float>(similarity);
}

std::optional<QStringList> VectorSearch::search(const QString& projectId,
                                                const QString& query,
                                                int limit)
{
    const std::optional<std::vector<SemanticMatch>> matches = searchScored(projectId, query, limit);
    if (!matches) {
        return std::nullopt;
    }
    return ids(*matches);
}

std::optional<std::vector<SemanticMatch>> VectorSearch::searchScored(const QString& projectId,
                                                                     const QString& query,
                                                                     int limit)
{
    if (!m_provider) {
        return std::nullopt;
    }

    const std::optional<std::vector<float>> queryEmbedding = m_provider->embed(query);
    if (!queryEmbedding) {
        LOG_DEBUG(mcRanking, "Vector search unavailable: query could not be embedded");
        return std::nullopt;
    }
    return searchByEmbedding(projectId, *queryEmbedding, limit);
}

std::vector<SemanticMatch> VectorSearch::searchByEmbedding(const QString& projectId,
                                                           const std::vector<float>& queryEmbedding,
                                                           int limit,
                                                           const QString& excludeId)
{
    std::vector<SemanticMatch> matches;
    if (!m_store || limit <= 0 || queryEmbedding.empty()) {
        return matches;
    }

    int skipped = 0;
    const std::vector<StoredEmbedding> rows = m_store->embeddingsForProject(projectId);
    for (const StoredEmbedding& row : rows) {
        if (!excludeId.isEmpty() && row.id == excludeId) {
            continue;
        }

        const std::optional<std::vector<float>> stored =
            Quantizer::deserialize(row.embedding.toUtf8());
        if (!stored) {
            ++skipped;
            continue;
        }

        const float similarity = cosineSimilarity(queryEmbedding, *stored);
        if (similarity > m_similarityFloor) {
            matches.push_back({row.id, similarity});
        }
    }

    if (skipped > 0) {
        LOG_WARN(mcRanking, "Vector search skipped %d malformed embeddings in project %s",
                 skipped, qPrintable(projectId));
    }

    std::stable_sort(matches.begin(), matches.end(),
                     [](const SemanticMatch& a, const SemanticMatch& b) {
                         return a.similarity > b.similarity;
                     });
    if (static_cast<int>(matches.size()) > limit) {
        matches.resize(static_cast<size_t>(limit));
    }
    return matches;
}

QStringList VectorSearch::ids(const std::vector<SemanticMatch>& matches)
{
    QStringList result;
    result.reserve(static_cast<int>(matches.size()));
    for (const SemanticMatch& match : matches) {
        result.append(match.id);
    }
    return result;
}

} // namespace mc
