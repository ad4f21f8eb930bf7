#include <QtTest/QtTest>
#include <QTemporaryDir>
#include <QTextStream>
#include "core/index/memory_store.h"
#include "fake_embedding_model.h"
#include "services/maintenance/maintenance_tool.h"

#include <memory>

class TestMaintenanceTool : public QObject {
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void testRebuildLexical();
    void testBackfillReportsCounts();
    void testSearchPrintsFusedIds();
    void testSimilarExcludesReference();
    void testSimilarWithoutEmbedding();
    void testOpenFailsOnUnusablePath();

private:
    QString seed(const QString& key, const QString& content);
    std::unique_ptr<mc::MaintenanceTool> makeTool();

    std::unique_ptr<QTemporaryDir> m_dir;
    mc::EngineSettings m_settings;
    mc::test::FakeModelLoader m_loader;
    QString m_out;
    QString m_err;
    QTextStream m_outStream{&m_out};
    QTextStream m_errStream{&m_err};
};

void TestMaintenanceTool::init()
{
    m_dir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_dir->isValid());
    m_settings = mc::EngineSettings();
    m_settings.dbPath = m_dir->path() + "/data/memories.db";
    // No write-path embedding: the backfill command does the work.
    m_settings.embeddingEnabled = false;
    m_loader = mc::test::FakeModelLoader();
    m_out.clear();
    m_err.clear();
}

void TestMaintenanceTool::cleanup()
{
    m_dir.reset();
}

QString TestMaintenanceTool::seed(const QString& key, const QString& content)
{
    QDir().mkpath(m_dir->path() + "/data");
    auto store = mc::MemoryStore::open(m_settings.dbPath);
    if (!store) {
        return QString();
    }
    const auto record = store->insertMemory(QStringLiteral("proj"), key, content);
    return record ? record->id : QString();
}

std::unique_ptr<mc::MaintenanceTool> TestMaintenanceTool::makeTool()
{
    auto tool = std::make_unique<mc::MaintenanceTool>(m_settings, m_loader.loader());
    tool->setOutput(&m_outStream, &m_errStream);
    return tool;
}

void TestMaintenanceTool::testRebuildLexical()
{
    QVERIFY(!seed(QStringLiteral("notes"), QStringLiteral("release train")).isEmpty());

    auto tool = makeTool();
    QVERIFY(tool->open());
    QCOMPARE(tool->rebuildLexical(), 0);
    QCOMPARE(m_out, QStringLiteral("lexical index rebuilt\n"));
}

void TestMaintenanceTool::testBackfillReportsCounts()
{
    QVERIFY(!seed(QStringLiteral("a"), QStringLiteral("first note")).isEmpty());
    QVERIFY(!seed(QStringLiteral("b"), QStringLiteral("second note")).isEmpty());
    QVERIFY(!seed(QStringLiteral("c"), QStringLiteral("third note")).isEmpty());

    auto tool = makeTool();
    QVERIFY(tool->open());
    QCOMPARE(tool->backfill(), 0);
    QCOMPARE(m_out, QStringLiteral("selected=3 embedded=3 failed=0\n"));

    m_out.clear();
    QCOMPARE(tool->backfill(), 0);
    QCOMPARE(m_out, QStringLiteral("selected=0 embedded=0 failed=0\n"));
}

void TestMaintenanceTool::testSearchPrintsFusedIds()
{
    const QString oauth = seed(QStringLiteral("auth/oauth"),
                               QStringLiteral("oauth device flow for the cli login"));
    const QString refresh = seed(QStringLiteral("auth/oauth-refresh"),
                                 QStringLiteral("oauth device flow refresh tokens"));
    const QString deploy = seed(QStringLiteral("deploy/rollout"),
                                QStringLiteral("rollout checklist for production deploys"));
    QVERIFY(!oauth.isEmpty() && !refresh.isEmpty() && !deploy.isEmpty());

    auto tool = makeTool();
    QVERIFY(tool->open());
    QCOMPARE(tool->backfill(), 0);
    m_out.clear();

    QCOMPARE(tool->search(QStringLiteral("proj"), QStringLiteral("oauth device flow"), 10), 0);
    const QStringList lines = m_out.split(QLatin1Char('\n'), Qt::SkipEmptyParts);
    QVERIFY(lines.size() >= 3);
    QVERIFY(lines.front().startsWith(QStringLiteral("# intent=")));
    QVERIFY(lines.front().contains(QStringLiteral("lexical=yes")));
    QVERIFY(lines.front().contains(QStringLiteral("semantic=yes")));

    const QStringList ids = lines.mid(1);
    QVERIFY(ids.contains(oauth));
    QVERIFY(ids.contains(refresh));
    QVERIFY(!ids.contains(deploy));
}

void TestMaintenanceTool::testSimilarExcludesReference()
{
    const QString oauth = seed(QStringLiteral("auth/oauth"),
                               QStringLiteral("oauth device flow for the cli login"));
    const QString refresh = seed(QStringLiteral("auth/oauth-refresh"),
                                 QStringLiteral("oauth device flow refresh tokens"));
    QVERIFY(!oauth.isEmpty() && !refresh.isEmpty());

    auto tool = makeTool();
    QVERIFY(tool->open());
    QCOMPARE(tool->backfill(), 0);
    m_out.clear();

    QCOMPARE(tool->similar(oauth, 10), 0);
    const QStringList ids = m_out.split(QLatin1Char('\n'), Qt::SkipEmptyParts);
    QCOMPARE(ids, QStringList{refresh});
    QVERIFY(m_err.isEmpty());
}

void TestMaintenanceTool::testSimilarWithoutEmbedding()
{
    const QString id = seed(QStringLiteral("k"), QStringLiteral("never embedded"));
    QVERIFY(!id.isEmpty());

    auto tool = makeTool();
    QVERIFY(tool->open());
    QCOMPARE(tool->similar(id, 10), 2);
    QVERIFY(m_out.isEmpty());
    QVERIFY(m_err.contains(QStringLiteral("no embedding available for ") + id));

    QCOMPARE(tool->similar(QStringLiteral("unknown-id"), 10), 2);
}

void TestMaintenanceTool::testOpenFailsOnUnusablePath()
{
    // A regular file where the database directory should be.
    QFile blocker(m_dir->path() + "/blocker");
    QVERIFY(blocker.open(QIODevice::WriteOnly));
    blocker.close();
    m_settings.dbPath = m_dir->path() + "/blocker/sub/memories.db";

    auto tool = makeTool();
    QVERIFY(!tool->open());
}

QTEST_MAIN(TestMaintenanceTool)
#include "test_maintenance_tool.moc"
