#pragma once

#include "core/embedding/embedding_provider.h"
#include "core/shared/settings.h"

#include <QObject>
#include <QString>
#include <QTextStream>

#include <memory>

namespace mc {

class HybridSearchEngine;
class MaintenanceScheduler;
class MemoryStore;

// Operator entry points behind the memctl-maintenance command line.
// Each command returns a process exit code.
class MaintenanceTool : public QObject {
    Q_OBJECT
public:
    // Without a loader the ONNX model named by the settings is used.
    explicit MaintenanceTool(const EngineSettings& settings,
                             EmbeddingProvider::ModelLoader loader = {},
                             QObject* parent = nullptr);
    ~MaintenanceTool() override;

    // Redirects command output (stdout and stderr by default).
    void setOutput(QTextStream* out, QTextStream* err);

    // Opens the database and wires the engine. Must succeed before any command.
    bool open();

    int rebuildLexical();
    int backfill();
    int search(const QString& projectId, const QString& query, int limit);
    int similar(const QString& memoryId, int limit);

    // Starts the recurring backfill and enters the event loop.
    int serve();

private:
    EngineSettings m_settings;
    EmbeddingProvider::ModelLoader m_loader;

    QTextStream m_stdout{stdout};
    QTextStream m_stderr{stderr};
    QTextStream* m_out = &m_stdout;
    QTextStream* m_err = &m_stderr;

    std::unique_ptr<MemoryStore> m_store;
    std::unique_ptr<EmbeddingProvider> m_provider;
    std::unique_ptr<HybridSearchEngine> m_engine;
    std::unique_ptr<MaintenanceScheduler> m_scheduler;
};

} // namespace mc
