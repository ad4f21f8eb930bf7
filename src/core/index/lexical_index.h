#pragma once

#include "core/index/memory_write_hook.h"

#include <QString>
#include <QStringList>

#include <atomic>
#include <optional>

namespace mc {

class MemoryStore;

// LexicalIndex: FTS5 shadow of memories(key, content, tags).
//
// Registered on the store as a write hook so every insert, update and delete
// updates the index in the same transaction. If the SQLite build has no FTS5
// (or setup fails for any other reason) the index reports itself unavailable
// for the rest of the process and search() returns nullopt.
class LexicalIndex : public MemoryWriteHook {
public:
    enum class State {
        Uninitialized,
        Ready,
        Unavailable,
    };

    // Registers itself as a write hook on `store`; unregisters on destruction.
    explicit LexicalIndex(MemoryStore* store);
    ~LexicalIndex() override;

    LexicalIndex(const LexicalIndex&) = delete;
    LexicalIndex& operator=(const LexicalIndex&) = delete;

    // Idempotent. A freshly created table is populated from the store.
    bool ensureIndex();
    bool isAvailable() const { return m_state.load() != State::Unavailable; }
    State state() const { return m_state.load(); }

    // Ids of matching non-archived memories in the project, best match first.
    // nullopt when the index is unavailable or the query has no usable terms.
    std::optional<QStringList> search(const QString& projectId, const QString& query, int limit);

    // Re-derives the whole index from the memories table.
    bool rebuild();

    // Strips FTS5 syntax characters and OR-combines the remaining terms as
    // quoted phrases: `auth flow` -> `"auth" OR "flow"`. Empty if nothing remains.
    static QString sanitizeQuery(const QString& query);

    bool onInsert(const MemoryRecord& inserted) override;
    bool onUpdate(const MemoryRecord& before, const MemoryRecord& after) override;
    bool onDelete(const MemoryRecord& removed) override;

private:
    struct Preparation {
        bool ready = false;
        bool rebuiltNow = false;
    };

    Preparation prepare();
    bool indexRecord(const char* sql, const MemoryRecord& record);

    MemoryStore* m_store = nullptr;
    std::atomic<State> m_state{State::Uninitialized};
};

} // namespace mc
