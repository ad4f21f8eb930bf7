#pragma once

#include <atomic>

namespace mc {

class EmbeddingProvider;
class MemoryStore;

struct BackfillReport {
    int selected = 0;
    int embedded = 0;
    int failed = 0;
    int failedBatches = 0;
    bool skipped = false;   // another run was in progress
};

// EmbeddingBackfill: fills in embeddings the write path never produced.
//
// One run selects up to batchLimit non-archived memories whose embedding is
// missing or stale, embeds them subBatchSize at a time and persists every
// success on its own. A result whose text was edited meanwhile is discarded. Failures are counted per item and per sub-batch; runOnce() never
// throws. Concurrent runs are refused rather than queued.
class EmbeddingBackfill {
public:
    static constexpr int kDefaultBatchLimit = 100;
    static constexpr int kDefaultSubBatchSize = 50;

    EmbeddingBackfill(MemoryStore* store,
                      EmbeddingProvider* provider,
                      int batchLimit = kDefaultBatchLimit,
                      int subBatchSize = kDefaultSubBatchSize);

    BackfillReport runOnce() noexcept;
    bool isRunning() const { return m_running.load(); }

    int batchLimit() const { return m_batchLimit; }
    int subBatchSize() const { return m_subBatchSize; }

private:
    void runLocked(BackfillReport& report);

    MemoryStore* m_store = nullptr;
    EmbeddingProvider* m_provider = nullptr;
    int m_batchLimit = kDefaultBatchLimit;
    int m_subBatchSize = kDefaultSubBatchSize;
    std::atomic<bool> m_running{false};
};

} // namespace mc
