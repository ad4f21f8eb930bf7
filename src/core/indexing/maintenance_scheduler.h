#pragma once

#include "core/indexing/embedding_backfill.h"

#include <QObject>
#include <QTimer>

#include <cstdint>
#include <memory>

namespace mc {

// Runs the embedding backfill on a fixed interval from the owning thread's
// event loop, independent of search traffic.
class MaintenanceScheduler : public QObject {
    Q_OBJECT
public:
    MaintenanceScheduler(EmbeddingBackfill* backfill, int64_t intervalMs,
                         QObject* parent = nullptr);
    ~MaintenanceScheduler() override;

    void start();
    void stop();
    bool isActive() const;
    int64_t intervalMs() const { return m_intervalMs; }
    int completedRuns() const { return m_completedRuns; }

    // Runs one backfill on the calling thread. Overlapping runs are refused.
    BackfillReport runNow();

signals:
    void backfillFinished(int selected, int embedded, int failed);

private slots:
    void onTimerFired();

private:
    EmbeddingBackfill* m_backfill = nullptr;
    int64_t m_intervalMs = 0;
    int m_completedRuns = 0;
    std::unique_ptr<QTimer> m_timer;
};

} // namespace mc
