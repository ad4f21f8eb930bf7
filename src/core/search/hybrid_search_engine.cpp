#include "core/search/hybrid_search_engine.h"
#include "core/embedding/embedding_provider.h"
#include "core/embedding/quantizer.h"
#include "core/index/memory_store.h"
#include "core/shared/logging.h"
#include "core/vector/rank_fusion.h"

#include <QElapsedTimer>

#include <algorithm>
#include <future>
#include <system_error>
#include <vector>

namespace mc {

HybridSearchEngine::HybridSearchEngine(MemoryStore* store,
                                       EmbeddingProvider* provider,
                                       const EngineSettings& settings)
    : m_store(store)
    , m_settings(settings)
    , m_lexicalIndex(store)
    , m_vectorSearch(store, provider, settings.similarityFloor)
    , m_backfill(store, provider, settings.backfillBatchLimit, settings.backfillSubBatchSize)
{
    m_lexicalIndex.ensureIndex();

    if (settings.embeddingEnabled && provider) {
        m_embeddingQueue = std::make_unique<EmbeddingQueue>(
            store, provider, static_cast<size_t>(std::max(1, settings.embeddingQueueCapacity)));
    } else {
        LOG_INFO(mcCore, "Embedding on write disabled");
    }
}

HybridSearchEngine::~HybridSearchEngine()
{
    // Stop the worker before the hooks and store go away.
    m_embeddingQueue.reset();
}

HybridSearchResult HybridSearchEngine::hybridSearch(const QString& projectId,
                                                    const QString& query,
                                                    int limit)
{
    HybridSearchResult result;
    result.classification = IntentClassifier::classify(query);
    result.weights = IntentClassifier::weights(result.classification.intent);
    if (limit <= 0) {
        return result;
    }

    QElapsedTimer timer;
    timer.start();

    auto runVector = [this, &projectId, &query, limit]() {
        return m_vectorSearch.search(projectId, query, limit);
    };

    std::future<std::optional<QStringList>> vectorFuture;
    try {
        vectorFuture = std::async(std::launch::async, runVector);
    } catch (const std::system_error& ex) {
        LOG_WARN(mcRanking, "Could not start vector search thread, running inline: %s", ex.what());
        vectorFuture = std::async(std::launch::deferred, runVector);
    }

    const std::optional<QStringList> lexical = m_lexicalIndex.search(projectId, query, limit);
    const std::optional<QStringList> semantic = vectorFuture.get();

    std::vector<QStringList> lists;
    if (lexical) {
        result.lexicalAvailable = true;
        lists.push_back(*lexical);
    }
    if (semantic) {
        result.semanticAvailable = true;
        lists.push_back(*semantic);
    }

    result.ids = RankFusion::fuse(lists, limit, m_settings.rrfK);

    LOG_DEBUG(mcRanking, "hybridSearch '%s' intent=%s lexical=%d semantic=%d fused=%d in %lld ms",
              qPrintable(query),
              qPrintable(searchIntentToString(result.classification.intent)),
              lexical ? static_cast<int>(lexical->size()) : -1,
              semantic ? static_cast<int>(semantic->size()) : -1,
              static_cast<int>(result.ids.size()),
              static_cast<long long>(timer.elapsed()));
    return result;
}

std::optional<QStringList> HybridSearchEngine::similar(const QString& memoryId, int limit)
{
    if (!m_store) {
        return std::nullopt;
    }

    const std::optional<MemoryRecord> reference = m_store->getMemory(memoryId);
    if (!reference || !reference->embedding) {
        return std::nullopt;
    }

    const std::optional<std::vector<float>> embedding =
        Quantizer::deserialize(reference->embedding->toUtf8());
    if (!embedding) {
        LOG_WARN(mcRanking, "Memory %s has a malformed embedding", qPrintable(memoryId));
        return std::nullopt;
    }

    return VectorSearch::ids(
        m_vectorSearch.searchByEmbedding(reference->projectId, *embedding, limit, memoryId));
}

bool HybridSearchEngine::rebuildLexicalIndex()
{
    return m_lexicalIndex.rebuild();
}

BackfillReport HybridSearchEngine::runEmbeddingBackfill()
{
    return m_backfill.runOnce();
}

} // namespace mc
