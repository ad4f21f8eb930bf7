#pragma once

#include "core/embedding/embedding_model.h"

#include <QString>

#include <atomic>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace mc {

struct EmbeddingCircuitBreaker {
    std::atomic<int> consecutiveFailures{0};
    std::atomic<int64_t> lastFailureTime{0};
    static constexpr int kOpenThreshold = 5;          // Open after 5 consecutive failures
    static constexpr int kHalfOpenDelayMs = 30000;    // Try again after 30s

    bool isOpen() const;
    void recordSuccess();
    void recordFailure();
};

// EmbeddingProvider -- owns the embedding model's load state.
//
// The model is loaded lazily on first use. Concurrent first callers share a
// single in-flight load. A failed load is not cached: the next call retries.
// No method throws; every failure surfaces as std::nullopt.
class EmbeddingProvider {
public:
    static constexpr int kEmbeddingDimensions = 384;

    // Returns nullptr (or throws) when the model cannot be loaded.
    using ModelLoader = std::function<std::unique_ptr<EmbeddingModel>()>;

    explicit EmbeddingProvider(ModelLoader loader, int dimensions = kEmbeddingDimensions);
    ~EmbeddingProvider();

    EmbeddingProvider(const EmbeddingProvider&) = delete;
    EmbeddingProvider& operator=(const EmbeddingProvider&) = delete;
    EmbeddingProvider(EmbeddingProvider&&) = delete;
    EmbeddingProvider& operator=(EmbeddingProvider&&) = delete;

    std::optional<std::vector<float>> embed(const QString& text);
    std::vector<std::optional<std::vector<float>>> embedBatch(const std::vector<QString>& texts);

    int dimensions() const { return m_dimensions; }
    bool isLoaded() const;
    int loadAttempts() const { return m_loadAttempts.load(); }

    // Expose for testing
    EmbeddingCircuitBreaker& circuitBreaker() { return m_circuitBreaker; }

private:
    std::shared_ptr<EmbeddingModel> acquireModel();
    std::shared_ptr<EmbeddingModel> loadModel();
    std::optional<std::vector<float>> embedWith(EmbeddingModel& model, const QString& text);

    ModelLoader m_loader;
    const int m_dimensions;

    mutable std::mutex m_mutex;
    std::shared_ptr<EmbeddingModel> m_model;
    std::shared_future<std::shared_ptr<EmbeddingModel>> m_pendingLoad;
    std::atomic<int> m_loadAttempts{0};

    EmbeddingCircuitBreaker m_circuitBreaker;
};

} // namespace mc
