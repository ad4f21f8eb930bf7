#include "core/embedding/embedding_provider.h"
#include "core/shared/logging.h"

#include <QElapsedTimer>

#include <chrono>
#include <exception>

namespace mc {

namespace {

int64_t steadyNowMs()
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now().time_since_epoch())
        .count();
}

} // namespace

bool EmbeddingCircuitBreaker::isOpen() const
{
    if (consecutiveFailures.load() < kOpenThreshold) {
        return false;
    }
    // In open state, check if enough time has elapsed for half-open
    const int64_t lastFail = lastFailureTime.load();
    if (steadyNowMs() - lastFail >= kHalfOpenDelayMs) {
        return false;  // half-open: allow one attempt
    }
    return true;
}

void EmbeddingCircuitBreaker::recordSuccess()
{
    consecutiveFailures.store(0);
}

void EmbeddingCircuitBreaker::recordFailure()
{
    consecutiveFailures.fetch_add(1);
    lastFailureTime.store(steadyNowMs());
}

EmbeddingProvider::EmbeddingProvider(ModelLoader loader, int dimensions)
    : m_loader(std::move(loader))
    , m_dimensions(dimensions)
{
}

EmbeddingProvider::~EmbeddingProvider() = default;

bool EmbeddingProvider::isLoaded() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_model != nullptr;
}

std::shared_ptr<EmbeddingModel> EmbeddingProvider::loadModel()
{
    m_loadAttempts.fetch_add(1);
    if (!m_loader) {
        LOG_WARN(mcEmbedding, "EmbeddingProvider: no model loader configured");
        return nullptr;
    }

    QElapsedTimer timer;
    timer.start();
    try {
        std::unique_ptr<EmbeddingModel> model = m_loader();
        if (!model) {
            LOG_WARN(mcEmbedding, "EmbeddingProvider: model failed to load");
            return nullptr;
        }
        if (model->dimensions() != m_dimensions) {
            LOG_WARN(mcEmbedding, "EmbeddingProvider: model produces %d dimensions, expected %d",
                     model->dimensions(), m_dimensions);
            return nullptr;
        }
        LOG_INFO(mcEmbedding, "EmbeddingProvider: model loaded in %lld ms (dimensions=%d)",
                 static_cast<long long>(timer.elapsed()), m_dimensions);
        return std::shared_ptr<EmbeddingModel>(std::move(model));
    } catch (const std::exception& ex) {
        LOG_WARN(mcEmbedding, "EmbeddingProvider: model load threw: %s", ex.what());
    } catch (...) {
        LOG_WARN(mcEmbedding, "EmbeddingProvider: model load threw a non-standard exception");
    }
    return nullptr;
}

std::shared_ptr<EmbeddingModel> EmbeddingProvider::acquireModel()
{
    std::promise<std::shared_ptr<EmbeddingModel>> loadPromise;
    std::shared_future<std::shared_ptr<EmbeddingModel>> pending;
    bool ownsLoad = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_model) {
            return m_model;
        }
        if (!m_pendingLoad.valid()) {
            m_pendingLoad = loadPromise.get_future().share();
            ownsLoad = true;
        }
        pending = m_pendingLoad;
    }

    if (!ownsLoad) {
        return pending.get();
    }

    // loadModel converts every failure to nullptr, so the promise below is
    // always fulfilled and waiting callers never see a broken promise.
    std::shared_ptr<EmbeddingModel> loaded = loadModel();
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_model = loaded;
        // Clearing the pending load lets the next caller retry after a failure.
        m_pendingLoad = {};
    }
    loadPromise.set_value(loaded);
    return loaded;
}

std::optional<std::vector<float>> EmbeddingProvider::embedWith(EmbeddingModel& model,
                                                                const QString& text)
{
    if (m_circuitBreaker.isOpen()) {
        LOG_DEBUG(mcEmbedding, "EmbeddingProvider circuit breaker is open, skipping inference");
        return std::nullopt;
    }

    try {
        std::vector<float> output = model.run({text});
        if (static_cast<int>(output.size()) != m_dimensions) {
            LOG_WARN(mcEmbedding, "EmbeddingProvider: expected %d values, model returned %zu",
                     m_dimensions, output.size());
            m_circuitBreaker.recordFailure();
            return std::nullopt;
        }
        m_circuitBreaker.recordSuccess();
        return output;
    } catch (const std::exception& ex) {
        LOG_WARN(mcEmbedding, "Embedding generation failed: %s", ex.what());
        m_circuitBreaker.recordFailure();
    } catch (...) {
        LOG_WARN(mcEmbedding, "Embedding generation failed with a non-standard exception");
        m_circuitBreaker.recordFailure();
    }
    return std::nullopt;
}

std::optional<std::vector<float>> EmbeddingProvider::embed(const QString& text)
{
    const std::shared_ptr<EmbeddingModel> model = acquireModel();
    if (!model) {
        return std::nullopt;
    }
    return embedWith(*model, text);
}

std::vector<std::optional<std::vector<float>>> EmbeddingProvider::embedBatch(
    const std::vector<QString>& texts)
{
    std::vector<std::optional<std::vector<float>>> results;
    if (texts.empty()) {
        return results;
    }
    if (texts.size() == 1) {
        results.push_back(embed(texts.front()));
        return results;
    }

    const std::shared_ptr<EmbeddingModel> model = acquireModel();
    if (!model) {
        results.resize(texts.size());
        return results;
    }

    if (model->supportsBatch() && !m_circuitBreaker.isOpen()) {
        try {
            const std::vector<float> flat = model->run(texts);
            const size_t dims = static_cast<size_t>(m_dimensions);
            results.reserve(texts.size());
            for (size_t i = 0; i < texts.size(); ++i) {
                const size_t start = i * dims;
                const size_t end = start + dims;
                if (end <= flat.size()) {
                    results.emplace_back(std::vector<float>(flat.begin() + static_cast<std::ptrdiff_t>(start),
                                                            flat.begin() + static_cast<std::ptrdiff_t>(end)));
                } else {
                    results.emplace_back(std::nullopt);
                }
            }
            m_circuitBreaker.recordSuccess();
            return results;
        } catch (const std::exception& ex) {
            LOG_WARN(mcEmbedding, "Batch embedding failed, falling back to sequential: %s",
                     ex.what());
            results.clear();
        } catch (...) {
            LOG_WARN(mcEmbedding, "Batch embedding failed, falling back to sequential");
            results.clear();
        }
    }

    results.reserve(texts.size());
    for (const QString& text : texts) {
        results.push_back(embedWith(*model, text));
    }
    return results;
}

} // namespace mc
