#pragma once

#include <QString>
#include <cstdint>

namespace mc {

struct EngineSettings {
    // Database
    QString dbPath;

    // Embedding model
    QString modelsDir;
    QString embeddingModelRole = QStringLiteral("bi-encoder");
    bool embeddingEnabled = true;
    int embeddingDimensions = 384;
    int embeddingQueueCapacity = 10000;

    // Retrieval
    float similarityFloor = 0.3f;
    int rrfK = 60;

    // Embedding backfill
    int64_t backfillIntervalMs = 6LL * 60 * 60 * 1000;   // 6 hours
    int backfillBatchLimit = 100;
    int backfillSubBatchSize = 50;
};

} // namespace mc
