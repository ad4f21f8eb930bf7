#pragma once

#include "core/index/lexical_index.h"
#include "core/indexing/embedding_backfill.h"
#include "core/indexing/embedding_queue.h"
#include "core/query/intent_classifier.h"
#include "core/shared/settings.h"
#include "core/vector/vector_search.h"

#include <QString>
#include <QStringList>

#include <memory>
#include <optional>

namespace mc {

class EmbeddingProvider;
class MemoryStore;

struct HybridSearchResult {
    QStringList ids;
    IntentClassification classification;
    IntentWeights weights;
    bool lexicalAvailable = false;
    bool semanticAvailable = false;
};

// HybridSearchEngine: retrieval entry points over one MemoryStore.
//
// Owns the lexical index and (when embeddings are enabled) the embedding
// queue, both registered as store write hooks for the engine's lifetime.
// The store and provider are injected and must outlive the engine.
class HybridSearchEngine {
public:
    HybridSearchEngine(MemoryStore* store,
                       EmbeddingProvider* provider,
                       const EngineSettings& settings = {});
    ~HybridSearchEngine();

    HybridSearchEngine(const HybridSearchEngine&) = delete;
    HybridSearchEngine& operator=(const HybridSearchEngine&) = delete;

    // Lexical and vector search run concurrently and are fused by RRF.
    // Either side may be unavailable; with both unavailable the ids are empty.
    HybridSearchResult hybridSearch(const QString& projectId, const QString& query, int limit);

    // Memories in the same project closest to the given memory's stored
    // embedding, excluding itself. nullopt when the memory is missing or
    // has no usable embedding.
    std::optional<QStringList> similar(const QString& memoryId, int limit);

    bool rebuildLexicalIndex();
    BackfillReport runEmbeddingBackfill();

    LexicalIndex& lexicalIndex() { return m_lexicalIndex; }
    VectorSearch& vectorSearch() { return m_vectorSearch; }
    EmbeddingBackfill& backfill() { return m_backfill; }
    EmbeddingQueue* embeddingQueue() { return m_embeddingQueue.get(); }

private:
    MemoryStore* m_store = nullptr;
    EngineSettings m_settings;

    LexicalIndex m_lexicalIndex;
    VectorSearch m_vectorSearch;
    EmbeddingBackfill m_backfill;
    std::unique_ptr<EmbeddingQueue> m_embeddingQueue;
};

} // namespace mc
