#include "maintenance_tool.h"

#include "core/embedding/onnx_embedding_model.h"
#include "core/index/memory_store.h"
#include "core/indexing/maintenance_scheduler.h"
#include "core/search/hybrid_search_engine.h"
#include "core/shared/logging.h"

#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QTimer>

#include <utility>

namespace mc {

MaintenanceTool::MaintenanceTool(const EngineSettings& settings,
                                 EmbeddingProvider::ModelLoader loader,
                                 QObject* parent)
    : QObject(parent)
    , m_settings(settings)
    , m_loader(std::move(loader))
{
    if (!m_loader) {
        const QString modelsDir = m_settings.modelsDir;
        const QString role = m_settings.embeddingModelRole;
        m_loader = [modelsDir, role]() -> std::unique_ptr<EmbeddingModel> {
            return OnnxEmbeddingModel::load(modelsDir, role);
        };
    }
}

MaintenanceTool::~MaintenanceTool()
{
    // Engine hooks and the queue worker reference the store.
    m_scheduler.reset();
    m_engine.reset();
    m_provider.reset();
    m_store.reset();
}

void MaintenanceTool::setOutput(QTextStream* out, QTextStream* err)
{
    m_out = out ? out : &m_stdout;
    m_err = err ? err : &m_stderr;
}

bool MaintenanceTool::open()
{
    const QFileInfo dbInfo(m_settings.dbPath);
    if (!QDir().mkpath(dbInfo.absolutePath())) {
        LOG_ERROR(mcCore, "Cannot create database directory %s",
                  qPrintable(dbInfo.absolutePath()));
        return false;
    }

    m_store = MemoryStore::open(m_settings.dbPath);
    if (!m_store) {
        return false;
    }

    m_provider = std::make_unique<EmbeddingProvider>(m_loader, m_settings.embeddingDimensions);

    m_engine = std::make_unique<HybridSearchEngine>(m_store.get(), m_provider.get(), m_settings);
    return true;
}

int MaintenanceTool::rebuildLexical()
{
    if (!m_engine->rebuildLexicalIndex()) {
        LOG_ERROR(mcIndex, "Lexical index rebuild failed");
        return 1;
    }
    *m_out << "lexical index rebuilt\n";
    m_out->flush();
    return 0;
}

int MaintenanceTool::backfill()
{
    const BackfillReport report = m_engine->runEmbeddingBackfill();
    *m_out << "selected=" << report.selected
           << " embedded=" << report.embedded
           << " failed=" << report.failed << '\n';
    m_out->flush();
    return 0;
}

int MaintenanceTool::search(const QString& projectId, const QString& query, int limit)
{
    const HybridSearchResult result = m_engine->hybridSearch(projectId, query, limit);

    QTextStream& out = *m_out;
    out << "# intent=" << searchIntentToString(result.classification.intent)
        << " confidence=" << result.classification.confidence
        << " lexical=" << (result.lexicalAvailable ? "yes" : "no")
        << " semantic=" << (result.semanticAvailable ? "yes" : "no") << '\n';
    for (const QString& id : result.ids) {
        out << id << '\n';
    }
    out.flush();
    return 0;
}

int MaintenanceTool::similar(const QString& memoryId, int limit)
{
    const std::optional<QStringList> ids = m_engine->similar(memoryId, limit);
    if (!ids) {
        *m_err << "no embedding available for " << memoryId << '\n';
        m_err->flush();
        return 2;
    }

    for (const QString& id : *ids) {
        *m_out << id << '\n';
    }
    m_out->flush();
    return 0;
}

int MaintenanceTool::serve()
{
    m_scheduler = std::make_unique<MaintenanceScheduler>(&m_engine->backfill(),
                                                         m_settings.backfillIntervalMs);
    m_scheduler->start();
    QTimer::singleShot(0, m_scheduler.get(), [this]() { m_scheduler->runNow(); });

    LOG_INFO(mcMaintenance, "memctl-maintenance serving %s", qPrintable(m_settings.dbPath));
    return QCoreApplication::exec();
}

} // namespace mc
