#include "core/indexing/embedding_queue.h"
#include "core/embedding/embedding_provider.h"
#include "core/embedding/quantizer.h"
#include "core/index/memory_store.h"
#include "core/shared/logging.h"

#include <chrono>
#include <exception>

namespace mc {

EmbeddingQueue::EmbeddingQueue(MemoryStore* store, EmbeddingProvider* provider, size_t capacity)
    : m_store(store)
    , m_provider(provider)
    , m_capacity(capacity > 0 ? capacity : 1)
{
    m_worker = std::thread([this]() { workerLoop(); });
    if (m_store) {
        m_store->addWriteHook(this);
    }
}

EmbeddingQueue::~EmbeddingQueue()
{
    if (m_store) {
        m_store->removeWriteHook(this);
    }
    shutdown();
}

// ── Enqueue ─────────────────────────────────────────────────

bool EmbeddingQueue::enqueue(EmbeddingJob job)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_shutdown) {
        LOG_DEBUG(mcEmbedding, "EmbeddingQueue::enqueue() called after shutdown");
        return false;
    }

    if (m_queue.size() >= m_capacity) {
        ++m_droppedItems;
        LOG_WARN(mcEmbedding, "EmbeddingQueue at capacity (%d), dropped memory %s",
                 static_cast<int>(m_capacity), qPrintable(job.memoryId));
        return false;
    }

    m_queue.push_back(std::move(job));
    m_cv.notify_one();
    return true;
}

// ── Dequeue ─────────────────────────────────────────────────

std::optional<EmbeddingJob> EmbeddingQueue::dequeue()
{
    std::unique_lock<std::mutex> lock(m_mutex);

    m_cv.wait(lock, [this] {
        return m_shutdown || !m_queue.empty();
    });

    if (m_shutdown) {
        return std::nullopt;
    }

    EmbeddingJob job = std::move(m_queue.front());
    m_queue.pop_front();
    ++m_activeItems;
    return job;
}

void EmbeddingQueue::markItemComplete(bool embedded)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_activeItems > 0) {
        --m_activeItems;
    }
    if (embedded) {
        ++m_embeddedItems;
    } else {
        ++m_failedItems;
    }
    if (m_activeItems == 0 && m_queue.empty()) {
        m_idleCv.notify_all();
    }
}

// ── Worker ──────────────────────────────────────────────────

void EmbeddingQueue::workerLoop()
{
    while (std::optional<EmbeddingJob> job = dequeue()) {
        bool embedded = false;
        try {
            embedded = process(*job);
        } catch (const std::exception& ex) {
            LOG_WARN(mcEmbedding, "Embedding job for memory %s failed: %s",
                     qPrintable(job->memoryId), ex.what());
        }
        markItemComplete(embedded);
    }
}

bool EmbeddingQueue::process(const EmbeddingJob& job)
{
    if (!m_provider || !m_store) {
        return false;
    }

    const std::optional<std::vector<float>> embedding = m_provider->embed(job.text);
    if (!embedding) {
        LOG_DEBUG(mcEmbedding, "No embedding for memory %s (model unavailable)",
                  qPrintable(job.memoryId));
        return false;
    }

    const QByteArray serialized = Quantizer::serialize(*embedding);
    if (serialized.isEmpty()) {
        return false;
    }
    return m_store->updateEmbedding(job.memoryId, QString::fromUtf8(serialized), job.revision);
}

// ── Shutdown / idle ─────────────────────────────────────────

void EmbeddingQueue::shutdown()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_shutdown) {
            m_shutdown = true;
            LOG_INFO(mcEmbedding, "EmbeddingQueue shutting down (depth=%d, dropped=%d)",
                     static_cast<int>(m_queue.size()),
                     static_cast<int>(m_droppedItems));
            m_queue.clear();
            m_cv.notify_all();
            m_idleCv.notify_all();
        }
    }
    if (m_worker.joinable() && m_worker.get_id() != std::this_thread::get_id()) {
        m_worker.join();
    }
}

bool EmbeddingQueue::waitForIdle(int timeoutMs)
{
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_idleCv.wait_for(lock, std::chrono::milliseconds(timeoutMs), [this] {
        return m_shutdown || (m_queue.empty() && m_activeItems == 0);
    });
}

// ── Size / stats ────────────────────────────────────────────

size_t EmbeddingQueue::size() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_queue.size();
}

EmbeddingQueueStats EmbeddingQueue::stats() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    EmbeddingQueueStats s;
    s.depth = m_queue.size();
    s.activeItems = m_activeItems;
    s.droppedItems = m_droppedItems;
    s.embeddedItems = m_embeddedItems;
    s.failedItems = m_failedItems;
    s.isShutdown = m_shutdown;
    return s;
}

// ── Write hooks ─────────────────────────────────────────────

bool EmbeddingQueue::onInsert(const MemoryRecord& inserted)
{
    Q_UNUSED(inserted);
    return true;
}

bool EmbeddingQueue::onUpdate(const MemoryRecord& before, const MemoryRecord& after)
{
    Q_UNUSED(before);
    Q_UNUSED(after);
    return true;
}

bool EmbeddingQueue::onDelete(const MemoryRecord& removed)
{
    Q_UNUSED(removed);
    return true;
}

void EmbeddingQueue::onCommitted(WriteKind kind, const MemoryRecord& record)
{
    if (kind == WriteKind::Delete) {
        return;
    }
    enqueue({record.id, embeddingText(record), record.revision});
}

} // namespace mc
