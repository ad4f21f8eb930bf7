#pragma once

#include "core/embedding/embedding_model.h"
#include "core/embedding/embedding_provider.h"

#include <QSet>
#include <QString>

#include <atomic>
#include <functional>
#include <memory>
#include <vector>

namespace mc::test {

// Deterministic stand-in for the ONNX model: a hashed bag of lowercase words,
// L2-normalized. Texts sharing words get positive cosine similarity.
class FakeEmbeddingModel : public EmbeddingModel {
public:
    explicit FakeEmbeddingModel(int dimensions = EmbeddingProvider::kEmbeddingDimensions);

    int dimensions() const override { return m_dimensions; }
    bool supportsBatch() const override { return batchSupported; }
    std::vector<float> run(const std::vector<QString>& texts) override;

    static std::vector<float> embedText(const QString& text,
                                        int dimensions = EmbeddingProvider::kEmbeddingDimensions);

    bool batchSupported = true;
    bool throwOnBatch = false;        // multi-text run() throws
    bool truncateBatchOutput = false; // multi-text run() drops the last row
    bool throwAlways = false;
    QSet<QString> failingTexts;       // single-text run() throws for these

    // Called at the start of every run(), before any output is computed.
    std::function<void(const std::vector<QString>&)> onRun;

    std::atomic<int> runCalls{0};
    std::atomic<int> batchRunCalls{0};

private:
    int m_dimensions;
};

// Loader wrapper that hands out one shared FakeEmbeddingModel and counts calls.
struct FakeModelLoader {
    std::shared_ptr<std::atomic<int>> calls = std::make_shared<std::atomic<int>>(0);
    std::shared_ptr<std::atomic<bool>> fail = std::make_shared<std::atomic<bool>>(false);
    int delayMs = 0;
    int dimensions = EmbeddingProvider::kEmbeddingDimensions;

    // Each call returns a fresh model configured by `configure` (if set).
    std::function<void(FakeEmbeddingModel&)> configure;

    EmbeddingProvider::ModelLoader loader() const;
};

} // namespace mc::test
