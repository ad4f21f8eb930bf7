#pragma once

#include "core/index/memory_write_hook.h"

#include <QString>

#include <condition_variable>
#include <cstdint>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <thread>

namespace mc {

class EmbeddingProvider;
class MemoryStore;

struct EmbeddingJob {
    QString memoryId;
    QString text;
    int64_t revision = 1;   // text revision the job embeds
};

struct EmbeddingQueueStats {
    size_t depth = 0;
    size_t activeItems = 0;
    size_t droppedItems = 0;
    size_t embeddedItems = 0;
    size_t failedItems = 0;
    bool isShutdown = false;
};

// EmbeddingQueue: bounded FIFO of embedding jobs drained by one worker thread.
//
// Registered on the store as a write hook: every committed insert, and every
// update that changed the embedded text, enqueues a job. The write never
// waits for the job. At capacity new jobs are refused and counted as dropped.
// A dropped or failed job leaves the memory's embedding missing or behind its
// text revision, which is what the backfill selects. Failures are only logged.
class EmbeddingQueue : public MemoryWriteHook {
public:
    static constexpr size_t kDefaultCapacity = 10000;

    EmbeddingQueue(MemoryStore* store,
                   EmbeddingProvider* provider,
                   size_t capacity = kDefaultCapacity);
    ~EmbeddingQueue() override;

    // Non-copyable, non-movable
    EmbeddingQueue(const EmbeddingQueue&) = delete;
    EmbeddingQueue& operator=(const EmbeddingQueue&) = delete;
    EmbeddingQueue(EmbeddingQueue&&) = delete;
    EmbeddingQueue& operator=(EmbeddingQueue&&) = delete;

    // Returns false if the job was dropped (full or shut down).
    bool enqueue(EmbeddingJob job);

    // Stops accepting jobs, discards pending ones and joins the worker.
    void shutdown();

    // Blocks until nothing is pending or in flight. Returns false on timeout.
    bool waitForIdle(int timeoutMs);

    size_t size() const;
    size_t capacity() const { return m_capacity; }
    EmbeddingQueueStats stats() const;

    bool onInsert(const MemoryRecord& inserted) override;
    bool onUpdate(const MemoryRecord& before, const MemoryRecord& after) override;
    bool onDelete(const MemoryRecord& removed) override;
    void onCommitted(WriteKind kind, const MemoryRecord& record) override;

private:
    std::optional<EmbeddingJob> dequeue();
    void markItemComplete(bool embedded);
    void workerLoop();
    bool process(const EmbeddingJob& job);

    MemoryStore* m_store = nullptr;
    EmbeddingProvider* m_provider = nullptr;
    const size_t m_capacity;

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::condition_variable m_idleCv;

    std::deque<EmbeddingJob> m_queue;
    size_t m_activeItems = 0;
    size_t m_droppedItems = 0;
    size_t m_embeddedItems = 0;
    size_t m_failedItems = 0;
    bool m_shutdown = false;

    std::thread m_worker;
};

} // namespace mc
