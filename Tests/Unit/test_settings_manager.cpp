#include <QtTest/QtTest>

#include "core/shared/settings_manager.h"

#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTemporaryDir>

namespace {

class ScopedEnvVar {
public:
    ScopedEnvVar(const char* key, const QByteArray& value)
        : key_(key)
        , oldValue_(qgetenv(key))
        , hadValue_(qEnvironmentVariableIsSet(key))
    {
        qputenv(key_, value);
    }

    ~ScopedEnvVar()
    {
        if (hadValue_) {
            qputenv(key_, oldValue_);
        } else {
            qunsetenv(key_);
        }
    }

private:
    const char* key_ = nullptr;
    QByteArray oldValue_;
    bool hadValue_ = false;
};

} // namespace

class TestSettingsManager : public QObject {
    Q_OBJECT

private slots:
    void testDefaults();
    void testSaveAndLoadRoundTrip();
    void testPartialJsonKeepsDefaults();
    void testOutOfRangeValuesClamped();
    void testMissingOrCorruptFile();
    void testSettingsPathFromEnvironment();
    void testModelsDirOverride();
};

void TestSettingsManager::testDefaults()
{
    const mc::EngineSettings settings;
    QCOMPARE(settings.embeddingDimensions, 384);
    QCOMPARE(settings.embeddingQueueCapacity, 10000);
    QCOMPARE(settings.similarityFloor, 0.3f);
    QCOMPARE(settings.rrfK, 60);
    QCOMPARE(settings.backfillIntervalMs, int64_t(6) * 60 * 60 * 1000);
    QCOMPARE(settings.backfillBatchLimit, 100);
    QCOMPARE(settings.backfillSubBatchSize, 50);
    QVERIFY(settings.embeddingEnabled);
    QCOMPARE(settings.embeddingModelRole, QStringLiteral("bi-encoder"));
}

void TestSettingsManager::testSaveAndLoadRoundTrip()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("nested/settings.json"));

    mc::EngineSettings settings;
    settings.dbPath = QStringLiteral("/tmp/memctl-test.db");
    settings.modelsDir = QStringLiteral("/opt/memctl/models");
    settings.embeddingEnabled = false;
    settings.similarityFloor = 0.45f;
    settings.rrfK = 30;
    settings.backfillIntervalMs = 60000;
    settings.backfillBatchLimit = 20;
    settings.backfillSubBatchSize = 5;

    QVERIFY(mc::SettingsManager::saveToFile(settings, path));
    const auto loaded = mc::SettingsManager::loadFromFile(path);
    QVERIFY(loaded.has_value());
    QCOMPARE(loaded->dbPath, settings.dbPath);
    QCOMPARE(loaded->modelsDir, settings.modelsDir);
    QCOMPARE(loaded->embeddingEnabled, false);
    QCOMPARE(loaded->similarityFloor, 0.45f);
    QCOMPARE(loaded->rrfK, 30);
    QCOMPARE(loaded->backfillIntervalMs, int64_t(60000));
    QCOMPARE(loaded->backfillBatchLimit, 20);
    QCOMPARE(loaded->backfillSubBatchSize, 5);
}

void TestSettingsManager::testPartialJsonKeepsDefaults()
{
    QJsonObject json;
    json.insert(QStringLiteral("rrfK"), 10);
    const mc::EngineSettings settings = mc::SettingsManager::fromJson(json);
    QCOMPARE(settings.rrfK, 10);
    QCOMPARE(settings.backfillBatchLimit, 100);
    QCOMPARE(settings.similarityFloor, 0.3f);
    QCOMPARE(settings.embeddingModelRole, QStringLiteral("bi-encoder"));
}

void TestSettingsManager::testOutOfRangeValuesClamped()
{
    QJsonObject json;
    json.insert(QStringLiteral("rrfK"), -5);
    json.insert(QStringLiteral("backfillIntervalMs"), 10);
    json.insert(QStringLiteral("backfillBatchLimit"), 0);
    json.insert(QStringLiteral("backfillSubBatchSize"), -1);
    json.insert(QStringLiteral("embeddingQueueCapacity"), 0);

    const mc::EngineSettings settings = mc::SettingsManager::fromJson(json);
    QCOMPARE(settings.rrfK, 0);
    QCOMPARE(settings.backfillIntervalMs, int64_t(1000));
    QCOMPARE(settings.backfillBatchLimit, 1);
    QCOMPARE(settings.backfillSubBatchSize, 1);
    QCOMPARE(settings.embeddingQueueCapacity, 1);
}

void TestSettingsManager::testMissingOrCorruptFile()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QVERIFY(!mc::SettingsManager::loadFromFile(dir.filePath(QStringLiteral("absent.json"))));

    const QString path = dir.filePath(QStringLiteral("settings.json"));
    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write("{ broken");
    file.close();
    QVERIFY(!mc::SettingsManager::loadFromFile(path).has_value());
}

void TestSettingsManager::testSettingsPathFromEnvironment()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("custom.json"));
    ScopedEnvVar env("MEMCTL_SETTINGS_PATH", path.toUtf8());

    QCOMPARE(mc::SettingsManager::settingsFilePath(), path);

    mc::EngineSettings settings;
    settings.rrfK = 42;
    QVERIFY(mc::SettingsManager::save(settings));
    const auto loaded = mc::SettingsManager::load();
    QVERIFY(loaded.has_value());
    QCOMPARE(loaded->rrfK, 42);

    const mc::EngineSettings resolved = mc::SettingsManager::loadOrDefault();
    QCOMPARE(resolved.rrfK, 42);
    QCOMPARE(resolved.dbPath, mc::SettingsManager::defaultDbPath());
}

void TestSettingsManager::testModelsDirOverride()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    ScopedEnvVar settingsEnv("MEMCTL_SETTINGS_PATH",
                             dir.filePath(QStringLiteral("none.json")).toUtf8());
    ScopedEnvVar modelsEnv("MEMCTL_MODELS_DIR", QByteArrayLiteral("/srv/models/"));

    const mc::EngineSettings settings = mc::SettingsManager::loadOrDefault();
    QCOMPARE(settings.modelsDir, QStringLiteral("/srv/models"));
    QVERIFY(!settings.dbPath.isEmpty());
}

QTEST_MAIN(TestSettingsManager)
#include "test_settings_manager.moc"
