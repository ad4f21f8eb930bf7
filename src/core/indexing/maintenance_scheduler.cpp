#include "core/indexing/maintenance_scheduler.h"
#include "core/shared/logging.h"

#include <algorithm>
#include <limits>

namespace mc {

MaintenanceScheduler::MaintenanceScheduler(EmbeddingBackfill* backfill, int64_t intervalMs,
                                           QObject* parent)
    : QObject(parent)
    , m_backfill(backfill)
    , m_intervalMs(std::clamp<int64_t>(intervalMs, 1, std::numeric_limits<int>::max()))
    , m_timer(std::make_unique<QTimer>(this))
{
    m_timer->setInterval(static_cast<int>(m_intervalMs));
    connect(m_timer.get(), &QTimer::timeout, this, &MaintenanceScheduler::onTimerFired);
}

MaintenanceScheduler::~MaintenanceScheduler() = default;

void MaintenanceScheduler::start()
{
    if (m_timer->isActive()) {
        return;
    }
    m_timer->start();
    LOG_INFO(mcMaintenance, "Maintenance scheduler started (interval=%lld ms)",
             static_cast<long long>(m_intervalMs));
}

void MaintenanceScheduler::stop()
{
    m_timer->stop();
}

bool MaintenanceScheduler::isActive() const
{
    return m_timer->isActive();
}

void MaintenanceScheduler::onTimerFired()
{
    runNow();
}

BackfillReport MaintenanceScheduler::runNow()
{
    BackfillReport report;
    if (!m_backfill) {
        return report;
    }

    report = m_backfill->runOnce();
    if (report.skipped) {
        return report;
    }

    ++m_completedRuns;
    emit backfillFinished(report.selected, report.embedded, report.failed);
    return report;
}

} // namespace mc
