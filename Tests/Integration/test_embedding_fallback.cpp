#include <QtTest/QtTest>
#include <QTemporaryDir>
#include "core/embedding/embedding_provider.h"
#include "core/index/memory_store.h"
#include "core/search/hybrid_search_engine.h"
#include "fake_embedding_model.h"

#include <memory>

class TestEmbeddingFallback : public QObject {
    Q_OBJECT

private slots:
    void testNoModelGracefulFallback();
    void testModelRecoversOnLaterCall();
    void testNoProviderAtAll();
    void testLexicalUnusableQueryLeavesSemantic();
    void testBothSidesUnavailable();
};

void TestEmbeddingFallback::testNoModelGracefulFallback()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    auto store = mc::MemoryStore::open(dir.path() + "/memories.db");
    QVERIFY(store != nullptr);

    mc::test::FakeModelLoader loader;
    loader.fail->store(true);
    mc::EmbeddingProvider provider(loader.loader());
    mc::HybridSearchEngine engine(store.get(), &provider);

    const auto record = store->insertMemory(QStringLiteral("proj"), QStringLiteral("db/wal"),
                                            QStringLiteral("sqlite runs in wal mode"));
    QVERIFY(record.has_value());
    QVERIFY(engine.embeddingQueue()->waitForIdle(5000));
    QVERIFY(!store->getMemory(record->id)->embedding.has_value());

    const mc::HybridSearchResult result = engine.hybridSearch("proj", "wal mode", 10);
    QVERIFY(result.lexicalAvailable);
    QVERIFY(!result.semanticAvailable);
    QCOMPARE(result.ids, QStringList{record->id});
}

void TestEmbeddingFallback::testModelRecoversOnLaterCall()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    auto store = mc::MemoryStore::open(dir.path() + "/memories.db");
    QVERIFY(store != nullptr);

    mc::test::FakeModelLoader loader;
    loader.fail->store(true);
    mc::EmbeddingProvider provider(loader.loader());
    mc::HybridSearchEngine engine(store.get(), &provider);

    const auto record = store->insertMemory(QStringLiteral("proj"), QStringLiteral("db/wal"),
                                            QStringLiteral("sqlite runs in wal mode"));
    QVERIFY(record.has_value());
    QVERIFY(engine.embeddingQueue()->waitForIdle(5000));

    loader.fail->store(false);
    const mc::BackfillReport report = engine.runEmbeddingBackfill();
    QCOMPARE(report.embedded, 1);

    const mc::HybridSearchResult result = engine.hybridSearch("proj", "wal mode", 10);
    QVERIFY(result.semanticAvailable);
    QCOMPARE(result.ids, QStringList{record->id});
}

void TestEmbeddingFallback::testNoProviderAtAll()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    auto store = mc::MemoryStore::open(dir.path() + "/memories.db");
    QVERIFY(store != nullptr);

    mc::HybridSearchEngine engine(store.get(), nullptr);
    QVERIFY(engine.embeddingQueue() == nullptr);

    const auto record = store->insertMemory(QStringLiteral("proj"), QStringLiteral("k"),
                                            QStringLiteral("plain keyword search"));
    QVERIFY(record.has_value());

    const mc::HybridSearchResult result = engine.hybridSearch("proj", "keyword", 10);
    QVERIFY(!result.semanticAvailable);
    QCOMPARE(result.ids, QStringList{record->id});

    const mc::BackfillReport report = engine.runEmbeddingBackfill();
    QCOMPARE(report.embedded, 0);
}

void TestEmbeddingFallback::testLexicalUnusableQueryLeavesSemantic()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    auto store = mc::MemoryStore::open(dir.path() + "/memories.db");
    QVERIFY(store != nullptr);

    mc::test::FakeModelLoader loader;
    mc::EmbeddingProvider provider(loader.loader());
    mc::HybridSearchEngine engine(store.get(), &provider);

    // Only matcher syntax: nothing survives sanitization.
    const mc::HybridSearchResult result = engine.hybridSearch("proj", "\"*\" ()", 10);
    QVERIFY(!result.lexicalAvailable);
    QVERIFY(result.semanticAvailable);
    QVERIFY(result.ids.isEmpty());
}

void TestEmbeddingFallback::testBothSidesUnavailable()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    auto store = mc::MemoryStore::open(dir.path() + "/memories.db");
    QVERIFY(store != nullptr);

    mc::test::FakeModelLoader loader;
    loader.fail->store(true);
    mc::EmbeddingProvider provider(loader.loader());
    mc::HybridSearchEngine engine(store.get(), &provider);

    const mc::HybridSearchResult result = engine.hybridSearch("proj", "***", 10);
    QVERIFY(!result.lexicalAvailable);
    QVERIFY(!result.semanticAvailable);
    QVERIFY(result.ids.isEmpty());
    QCOMPARE(result.classification.intent, mc::SearchIntent::Entity);
}

QTEST_MAIN(TestEmbeddingFallback)
#include "test_embedding_fallback.moc"
