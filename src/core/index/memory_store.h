#pragma once

#include "core/index/memory_write_hook.h"
#include "core/shared/types.h"

#include <QString>
#include <QStringList>

#include <sqlite3.h>

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace mc {

// Partial update: unset fields are left untouched.
struct MemoryUpdate {
    std::optional<QString> key;
    std::optional<QString> content;
    std::optional<QStringList> tags;
};

// MemoryStore: owner of the SQLite database holding project memories.
//
// One serialized connection guarded by a recursive mutex, so write hooks and
// collaborators (the lexical index) can re-enter through withConnection()
// while a write transaction is open. Every insert/update/delete runs the
// registered hooks inside its transaction.
class MemoryStore {
public:
    ~MemoryStore();

    MemoryStore(const MemoryStore&) = delete;
    MemoryStore& operator=(const MemoryStore&) = delete;
    MemoryStore(MemoryStore&&) = delete;
    MemoryStore& operator=(MemoryStore&&) = delete;

    // Open or create the database at the given path.
    // Creates schema and sets pragmas on first open.
    static std::unique_ptr<MemoryStore> open(const QString& dbPath);

    // Hooks are not owned and must outlive their registration.
    void addWriteHook(MemoryWriteHook* hook);
    void removeWriteHook(MemoryWriteHook* hook);

    // ── Memories ────────────────────────────────────────────

    // Returns nullopt on failure, including a duplicate key in the project.
    std::optional<MemoryRecord> insertMemory(const QString& projectId,
                                             const QString& key,
                                             const QString& content,
                                             const QStringList& tags = {});

    // Returns the updated record, or nullopt if the memory does not exist or
    // the write failed. An update that changes nothing skips the hooks.
    std::optional<MemoryRecord> updateMemory(const QString& id, const MemoryUpdate& update);

    bool deleteMemory(const QString& id);

    // Archived memories stay in the table but are excluded from retrieval.
    bool archiveMemory(const QString& id);
    bool archiveMemory(const QString& id, double archivedAt);

    std::optional<MemoryRecord> getMemory(const QString& id);

    // ── Embeddings ──────────────────────────────────────────

    // Non-archived memories of the project that carry an embedding.
    std::vector<StoredEmbedding> embeddingsForProject(const QString& projectId);

    // Oldest non-archived memories (any project) whose embedding is missing
    // or was computed from an older revision of the text.
    std::vector<MemoryRecord> memoriesMissingEmbedding(int limit);

    // Stores an embedding of the memory's current text.
    bool updateEmbedding(const QString& id, const QString& serialized);

    // Stores an embedding computed from the given text revision. Refused
    // (returns false) once the memory has moved past that revision, so a
    // slow writer never overwrites the embedding of newer text.
    bool updateEmbedding(const QString& id, const QString& serialized, int64_t revision);

    // Writes all pairs (id, serialized) of current text in one transaction.
    bool updateEmbeddings(const std::vector<std::pair<QString, QString>>& embeddings);

    int64_t countMemories();

    // ── Connection access ───────────────────────────────────

    template <typename Fn>
    auto withConnection(Fn&& fn) -> decltype(fn(static_cast<sqlite3*>(nullptr)))
    {
        std::lock_guard<std::recursive_mutex> lock(m_mutex);
        return fn(m_db);
    }

    bool execSql(const char* sql);

    bool beginTransaction();
    bool commitTransaction();
    bool rollbackTransaction();

    bool integrityCheck();

private:
    MemoryStore() = default;
    bool init(const QString& dbPath);

    std::optional<MemoryRecord> getMemoryLocked(const QString& id);
    bool runHooks(WriteKind kind, const MemoryRecord* before, const MemoryRecord& after);
    void notifyCommitted(WriteKind kind, const MemoryRecord& record);

    sqlite3* m_db = nullptr;
    std::recursive_mutex m_mutex;
    std::vector<MemoryWriteHook*> m_hooks;
};

} // namespace mc
