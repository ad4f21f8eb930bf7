#include <QtTest/QtTest>
#include <QSignalSpy>
#include <QTemporaryDir>
#include "core/embedding/embedding_provider.h"
#include "core/index/memory_store.h"
#include "core/indexing/embedding_backfill.h"
#include "core/indexing/maintenance_scheduler.h"
#include "fake_embedding_model.h"

#include <limits>
#include <memory>

class TestMaintenanceScheduler : public QObject {
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void testRunNowEmitsReport();
    void testTimerDrivesBackfill();
    void testStartStop();
    void testIntervalClamped();
    void testUnavailableModelStillFinishes();
    void testNoBackfillIsHarmless();

private:
    void addMemories(int count);

    std::unique_ptr<QTemporaryDir> m_dir;
    std::unique_ptr<mc::MemoryStore> m_store;
};

void TestMaintenanceScheduler::init()
{
    m_dir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_dir->isValid());
    m_store = mc::MemoryStore::open(m_dir->path() + "/memories.db");
    QVERIFY(m_store != nullptr);
}

void TestMaintenanceScheduler::cleanup()
{
    m_store.reset();
    m_dir.reset();
}

void TestMaintenanceScheduler::addMemories(int count)
{
    for (int i = 0; i < count; ++i) {
        QVERIFY(m_store->insertMemory(QStringLiteral("proj"), QStringLiteral("k%1").arg(i),
                                      QStringLiteral("maintenance body %1").arg(i)));
    }
}

void TestMaintenanceScheduler::testRunNowEmitsReport()
{
    addMemories(3);
    mc::test::FakeModelLoader loader;
    mc::EmbeddingProvider provider(loader.loader());
    mc::EmbeddingBackfill backfill(m_store.get(), &provider);
    mc::MaintenanceScheduler scheduler(&backfill, 60000);

    QSignalSpy spy(&scheduler, &mc::MaintenanceScheduler::backfillFinished);
    const mc::BackfillReport report = scheduler.runNow();

    QCOMPARE(report.embedded, 3);
    QCOMPARE(spy.count(), 1);
    const QList<QVariant> args = spy.takeFirst();
    QCOMPARE(args.at(0).toInt(), 3);
    QCOMPARE(args.at(1).toInt(), 3);
    QCOMPARE(args.at(2).toInt(), 0);
    QCOMPARE(scheduler.completedRuns(), 1);
}

void TestMaintenanceScheduler::testTimerDrivesBackfill()
{
    addMemories(5);
    mc::test::FakeModelLoader loader;
    mc::EmbeddingProvider provider(loader.loader());
    mc::EmbeddingBackfill backfill(m_store.get(), &provider, 2, 1);
    mc::MaintenanceScheduler scheduler(&backfill, 20);

    QSignalSpy spy(&scheduler, &mc::MaintenanceScheduler::backfillFinished);
    scheduler.start();

    // Two memories per run: three runs drain the backlog.
    QTRY_VERIFY_WITH_TIMEOUT(m_store->memoriesMissingEmbedding(10).empty(), 5000);
    QVERIFY(spy.count() >= 3);
    QVERIFY(scheduler.completedRuns() >= 3);
    scheduler.stop();
}

void TestMaintenanceScheduler::testStartStop()
{
    mc::EmbeddingBackfill backfill(m_store.get(), nullptr);
    mc::MaintenanceScheduler scheduler(&backfill, 60000);
    QVERIFY(!scheduler.isActive());
    scheduler.start();
    scheduler.start();
    QVERIFY(scheduler.isActive());
    scheduler.stop();
    QVERIFY(!scheduler.isActive());
}

void TestMaintenanceScheduler::testIntervalClamped()
{
    mc::EmbeddingBackfill backfill(m_store.get(), nullptr);
    mc::MaintenanceScheduler tooSmall(&backfill, 0);
    QCOMPARE(tooSmall.intervalMs(), int64_t(1));

    mc::MaintenanceScheduler tooLarge(&backfill, int64_t(1) << 40);
    QCOMPARE(tooLarge.intervalMs(), int64_t(std::numeric_limits<int>::max()));
}

void TestMaintenanceScheduler::testUnavailableModelStillFinishes()
{
    addMemories(2);
    mc::test::FakeModelLoader loader;
    loader.fail->store(true);
    mc::EmbeddingProvider provider(loader.loader());
    mc::EmbeddingBackfill backfill(m_store.get(), &provider);
    mc::MaintenanceScheduler scheduler(&backfill, 60000);

    QSignalSpy spy(&scheduler, &mc::MaintenanceScheduler::backfillFinished);
    const mc::BackfillReport report = scheduler.runNow();
    QCOMPARE(report.failed, 2);
    QCOMPARE(spy.count(), 1);
    QCOMPARE(spy.at(0).at(2).toInt(), 2);
}

void TestMaintenanceScheduler::testNoBackfillIsHarmless()
{
    mc::MaintenanceScheduler scheduler(nullptr, 1000);
    QSignalSpy spy(&scheduler, &mc::MaintenanceScheduler::backfillFinished);
    const mc::BackfillReport report = scheduler.runNow();
    QCOMPARE(report.selected, 0);
    QCOMPARE(spy.count(), 0);
    QCOMPARE(scheduler.completedRuns(), 0);
}

QTEST_MAIN(TestMaintenanceScheduler)
#include "test_maintenance_scheduler.moc"
