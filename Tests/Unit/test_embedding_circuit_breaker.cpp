#include <QtTest/QtTest>
#include "core/embedding/embedding_provider.h"
#include "fake_embedding_model.h"

#include <chrono>

class TestEmbeddingCircuitBreaker : public QObject {
    Q_OBJECT

private slots:
    void testCircuitBreakerInitiallyClosed();
    void testCircuitBreakerOpensAfterThreshold();
    void testCircuitBreakerResetsOnSuccess();
    void testCircuitBreakerHalfOpenAfterDelay();
    void testCircuitBreakerConstants();
    void testProviderStopsCallingModelWhileOpen();
};

void TestEmbeddingCircuitBreaker::testCircuitBreakerInitiallyClosed()
{
    mc::EmbeddingCircuitBreaker cb;
    QVERIFY(!cb.isOpen());
    QCOMPARE(cb.consecutiveFailures.load(), 0);
}

void TestEmbeddingCircuitBreaker::testCircuitBreakerOpensAfterThreshold()
{
    mc::EmbeddingCircuitBreaker cb;

    // Record failures up to threshold
    for (int i = 0; i < mc::EmbeddingCircuitBreaker::kOpenThreshold; ++i) {
        cb.recordFailure();
    }

    // Circuit should now be open
    QVERIFY(cb.isOpen());
    QCOMPARE(cb.consecutiveFailures.load(),
             mc::EmbeddingCircuitBreaker::kOpenThreshold);
}

void TestEmbeddingCircuitBreaker::testCircuitBreakerResetsOnSuccess()
{
    mc::EmbeddingCircuitBreaker cb;

    // Record some failures (but not enough to open)
    cb.recordFailure();
    cb.recordFailure();
    cb.recordFailure();
    QCOMPARE(cb.consecutiveFailures.load(), 3);
    QVERIFY(!cb.isOpen());

    // Success should reset the counter
    cb.recordSuccess();
    QCOMPARE(cb.consecutiveFailures.load(), 0);
    QVERIFY(!cb.isOpen());
}

void TestEmbeddingCircuitBreaker::testCircuitBreakerHalfOpenAfterDelay()
{
    mc::EmbeddingCircuitBreaker cb;

    // Open the circuit
    for (int i = 0; i < mc::EmbeddingCircuitBreaker::kOpenThreshold; ++i) {
        cb.recordFailure();
    }
    QVERIFY(cb.isOpen());

    // Simulate time passing by manually setting lastFailureTime to the past
    const auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
                         std::chrono::steady_clock::now().time_since_epoch())
                         .count();
    cb.lastFailureTime.store(now - mc::EmbeddingCircuitBreaker::kHalfOpenDelayMs - 1000);

    // Circuit should now be half-open (isOpen returns false to allow a retry)
    QVERIFY(!cb.isOpen());

    // After a successful retry, counter resets
    cb.recordSuccess();
    QCOMPARE(cb.consecutiveFailures.load(), 0);
    QVERIFY(!cb.isOpen());
}

void TestEmbeddingCircuitBreaker::testCircuitBreakerConstants()
{
    QCOMPARE(mc::EmbeddingCircuitBreaker::kOpenThreshold, 5);
    QCOMPARE(mc::EmbeddingCircuitBreaker::kHalfOpenDelayMs, 30000);
}

void TestEmbeddingCircuitBreaker::testProviderStopsCallingModelWhileOpen()
{
    mc::test::FakeModelLoader loader;
    mc::test::FakeEmbeddingModel* model = nullptr;
    loader.configure = [&model](mc::test::FakeEmbeddingModel& m) {
        m.throwAlways = true;
        model = &m;
    };
    mc::EmbeddingProvider provider(loader.loader());

    for (int i = 0; i < mc::EmbeddingCircuitBreaker::kOpenThreshold; ++i) {
        QVERIFY(!provider.embed(QStringLiteral("text")).has_value());
    }
    QVERIFY(model != nullptr);
    QCOMPARE(model->runCalls.load(), mc::EmbeddingCircuitBreaker::kOpenThreshold);
    QVERIFY(provider.circuitBreaker().isOpen());

    // Open circuit: the model is not invoked at all.
    QVERIFY(!provider.embed(QStringLiteral("text")).has_value());
    QCOMPARE(model->runCalls.load(), mc::EmbeddingCircuitBreaker::kOpenThreshold);

    // Half-open after the delay: one attempt goes through.
    const auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
                         std::chrono::steady_clock::now().time_since_epoch())
                         .count();
    provider.circuitBreaker().lastFailureTime.store(
        now - mc::EmbeddingCircuitBreaker::kHalfOpenDelayMs - 1000);
    model->throwAlways = false;
    QVERIFY(provider.embed(QStringLiteral("text")).has_value());
    QCOMPARE(provider.circuitBreaker().consecutiveFailures.load(), 0);
}

QTEST_MAIN(TestEmbeddingCircuitBreaker)
#include "test_embedding_circuit_breaker.moc"
