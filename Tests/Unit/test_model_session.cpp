#include <QtTest/QtTest>

#include "core/embedding/onnx_embedding_model.h"
#include "core/models/model_manifest.h"
#include "core/models/model_session.h"

#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTemporaryDir>

#include <cmath>

namespace {

bool writeFile(const QString& path, const QByteArray& bytes)
{
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return false;
    }
    return file.write(bytes) == bytes.size();
}

QJsonObject biEncoderManifest(const QString& file)
{
    QJsonObject entry;
    entry.insert(QStringLiteral("name"), QStringLiteral("all-minilm-l6-v2"));
    entry.insert(QStringLiteral("file"), file);
    entry.insert(QStringLiteral("dimensions"), 384);
    entry.insert(QStringLiteral("inputs"),
                 QJsonArray{QStringLiteral("input_ids"), QStringLiteral("attention_mask")});

    QJsonObject models;
    models.insert(QStringLiteral("bi-encoder"), entry);
    QJsonObject root;
    root.insert(QStringLiteral("models"), models);
    return root;
}

} // namespace

class TestModelSession : public QObject {
    Q_OBJECT

private slots:
    void testInitializeFailsWhenModelPathMissing();
    void testMetadataAccessorsRemainStableOnFailure();
    void testCorruptModelFileRejected();
    void testEmbeddingModelLoadFailsWithoutManifest();
    void testEmbeddingModelLoadFailsForUnknownRole();
    void testEmbeddingModelLoadFailsWithoutVocab();
    void testEmbeddingModelLoadFailsForCorruptModel();
    void testNormalize();
};

void TestModelSession::testInitializeFailsWhenModelPathMissing()
{
    mc::ModelManifestEntry entry;
    entry.name = QStringLiteral("unit-test-model");
    entry.file = QStringLiteral("missing.onnx");
    entry.inputs = {QStringLiteral("input_ids"), QStringLiteral("attention_mask")};

    mc::ModelSession session(entry);
    QVERIFY(!session.initialize(QStringLiteral("/no/such/model.onnx")));
    QVERIFY(!session.isAvailable());
    QVERIFY(session.rawSession() == nullptr);
}

void TestModelSession::testMetadataAccessorsRemainStableOnFailure()
{
    mc::ModelManifestEntry entry;
    entry.name = QStringLiteral("bi-encoder");
    entry.file = QStringLiteral("model.onnx");
    entry.intraOpThreads = 4;

    mc::ModelSession session(entry);
    QVERIFY(!session.initialize(QString()));

    QCOMPARE(session.manifest().name, QStringLiteral("bi-encoder"));
    QCOMPARE(session.manifest().intraOpThreads, 4);
    QVERIFY(session.inputNames().empty());
    QVERIFY(session.outputNames().empty());
    QVERIFY(session.rawSession() == nullptr);
}

void TestModelSession::testCorruptModelFileRejected()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());
    const QString modelPath = tempDir.filePath(QStringLiteral("fake.onnx"));
    QVERIFY(writeFile(modelPath, "not-a-real-onnx-model"));

    mc::ModelManifestEntry entry;
    entry.name = QStringLiteral("corrupt");
    entry.file = QStringLiteral("fake.onnx");
    entry.inputs = {QStringLiteral("input_ids")};

    mc::ModelSession session(entry);
    QVERIFY(!session.initialize(modelPath));
    QVERIFY(!session.isAvailable());
    QVERIFY(session.rawSession() == nullptr);
}

void TestModelSession::testEmbeddingModelLoadFailsWithoutManifest()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());
    QVERIFY(mc::OnnxEmbeddingModel::load(tempDir.path(), QStringLiteral("bi-encoder")) == nullptr);
}

void TestModelSession::testEmbeddingModelLoadFailsForUnknownRole()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());
    QVERIFY(writeFile(tempDir.filePath(QStringLiteral("manifest.json")),
                      QJsonDocument(biEncoderManifest(QStringLiteral("model.onnx"))).toJson()));
    QVERIFY(mc::OnnxEmbeddingModel::load(tempDir.path(), QStringLiteral("cross-encoder")) == nullptr);
}

void TestModelSession::testEmbeddingModelLoadFailsWithoutVocab()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());
    QVERIFY(writeFile(tempDir.filePath(QStringLiteral("manifest.json")),
                      QJsonDocument(biEncoderManifest(QStringLiteral("model.onnx"))).toJson()));
    QVERIFY(writeFile(tempDir.filePath(QStringLiteral("model.onnx")), "placeholder"));
    QVERIFY(mc::OnnxEmbeddingModel::load(tempDir.path(), QStringLiteral("bi-encoder")) == nullptr);
}

void TestModelSession::testEmbeddingModelLoadFailsForCorruptModel()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());
    QVERIFY(writeFile(tempDir.filePath(QStringLiteral("manifest.json")),
                      QJsonDocument(biEncoderManifest(QStringLiteral("model.onnx"))).toJson()));
    QVERIFY(writeFile(tempDir.filePath(QStringLiteral("vocab.txt")), "[PAD]\n[UNK]\nhello\n"));
    QVERIFY(writeFile(tempDir.filePath(QStringLiteral("model.onnx")), "not-a-real-onnx-model"));
    QVERIFY(mc::OnnxEmbeddingModel::load(tempDir.path(), QStringLiteral("bi-encoder")) == nullptr);
}

void TestModelSession::testNormalize()
{
    std::vector<float> v = {3.0f, 4.0f};
    mc::OnnxEmbeddingModel::normalize(v);
    QVERIFY(std::fabs(v[0] - 0.6f) < 1e-6f);
    QVERIFY(std::fabs(v[1] - 0.8f) < 1e-6f);

    std::vector<float> zero = {0.0f, 0.0f};
    mc::OnnxEmbeddingModel::normalize(zero);
    QCOMPARE(zero[0], 0.0f);
    QCOMPARE(zero[1], 0.0f);
}

QTEST_MAIN(TestModelSession)
#include "test_model_session.moc"
