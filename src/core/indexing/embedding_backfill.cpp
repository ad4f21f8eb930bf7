#include "core/indexing/embedding_backfill.h"
#include "core/embedding/embedding_provider.h"
#include "core/embedding/quantizer.h"
#include "core/index/memory_store.h"
#include "core/shared/logging.h"

#include <QElapsedTimer>

#include <algorithm>
#include <exception>

namespace mc {

EmbeddingBackfill::EmbeddingBackfill(MemoryStore* store,
                                     EmbeddingProvider* provider,
                                     int batchLimit,
                                     int subBatchSize)
    : m_store(store)
    , m_provider(provider)
    , m_batchLimit(std::max(1, batchLimit))
    , m_subBatchSize(std::max(1, subBatchSize))
{
}

BackfillReport EmbeddingBackfill::runOnce() noexcept
{
    BackfillReport report;
    if (m_running.exchange(true)) {
        LOG_INFO(mcMaintenance, "Embedding backfill already running, skipping");
        report.skipped = true;
        return report;
    }

    QElapsedTimer timer;
    timer.start();
    try {
        runLocked(report);
    } catch (const std::exception& ex) {
        LOG_WARN(mcMaintenance, "Embedding backfill aborted: %s", ex.what());
    }

    LOG_INFO(mcMaintenance, "Embedding backfill: %d selected, %d embedded, %d failed "
             "(%d failed batches) in %lld ms",
             report.selected, report.embedded, report.failed, report.failedBatches,
             static_cast<long long>(timer.elapsed()));
    m_running.store(false);
    return report;
}

void EmbeddingBackfill::runLocked(BackfillReport& report)
{
    if (!m_store || !m_provider) {
        return;
    }

    const std::vector<MemoryRecord> pending = m_store->memoriesMissingEmbedding(m_batchLimit);
    report.selected = static_cast<int>(pending.size());
    if (pending.empty()) {
        return;
    }

    for (size_t start = 0; start < pending.size(); start += static_cast<size_t>(m_subBatchSize)) {
        const size_t end = std::min(pending.size(), start + static_cast<size_t>(m_subBatchSize));
        const int batchCount = static_cast<int>(end - start);

        std::vector<QString> texts;
        texts.reserve(end - start);
        for (size_t i = start; i < end; ++i) {
            texts.push_back(embeddingText(pending[i]));
        }

        std::vector<std::optional<std::vector<float>>> embeddings;
        try {
            embeddings = m_provider->embedBatch(texts);
        } catch (const std::exception& ex) {
            LOG_WARN(mcMaintenance, "Backfill sub-batch of %d failed: %s", batchCount, ex.what());
            ++report.failedBatches;
            report.failed += batchCount;
            continue;
        }

        for (size_t i = start; i < end; ++i) {
            const MemoryRecord& memory = pending[i];
            const size_t slot = i - start;
            if (slot >= embeddings.size() || !embeddings[slot]) {
                ++report.failed;
                continue;
            }

            try {
                const QByteArray serialized = Quantizer::serialize(*embeddings[slot]);
                if (!serialized.isEmpty()
                    && m_store->updateEmbedding(memory.id, QString::fromUtf8(serialized),
                                                memory.revision)) {
                    ++report.embedded;
                } else {
                    ++report.failed;
                }
            } catch (const std::exception& ex) {
                LOG_WARN(mcMaintenance, "Backfill failed for memory %s: %s",
                         qPrintable(memory.id), ex.what());
                ++report.failed;
            }
        }
    }
}

} // namespace mc
