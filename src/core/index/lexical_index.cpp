#include "core/index/lexical_index.h"
#include "core/index/memory_store.h"
#include "core/index/schema.h"
#include "core/shared/logging.h"

#include <QRegularExpression>

#include <sqlite3.h>

namespace mc {

LexicalIndex::LexicalIndex(MemoryStore* store)
    : m_store(store)
{
    if (m_store) {
        m_store->addWriteHook(this);
    }
}

LexicalIndex::~LexicalIndex()
{
    if (m_store) {
        m_store->removeWriteHook(this);
    }
}

LexicalIndex::Preparation LexicalIndex::prepare()
{
    Preparation result;
    const State current = m_state.load();
    if (current == State::Ready) {
        result.ready = true;
        return result;
    }
    if (current == State::Unavailable || !m_store) {
        return result;
    }

    return m_store->withConnection([this](sqlite3* db) {
        Preparation prep;
        // Inside a write transaction the table creation can still be rolled back.
        const bool inTransaction = sqlite3_get_autocommit(db) == 0;
        // Another caller may have finished setup while we waited for the lock.
        const State state = m_state.load();
        if (state != State::Uninitialized) {
            prep.ready = state == State::Ready;
            return prep;
        }

        bool existed = false;
        {
            sqlite3_stmt* stmt = nullptr;
            if (sqlite3_prepare_v2(db,
                    "SELECT count(*) FROM sqlite_master WHERE type='table' AND name=?1",
                    -1, &stmt, nullptr) == SQLITE_OK) {
                sqlite3_bind_text(stmt, 1, kLexicalIndexTable, -1, SQLITE_STATIC);
                if (sqlite3_step(stmt) == SQLITE_ROW) {
                    existed = sqlite3_column_int(stmt, 0) > 0;
                }
            }
            sqlite3_finalize(stmt);
        }

        char* errMsg = nullptr;
        if (sqlite3_exec(db, kLexicalIndexSchema, nullptr, nullptr, &errMsg) != SQLITE_OK) {
            LOG_WARN(mcIndex, "Lexical index unavailable: %s", errMsg ? errMsg : "unknown");
            sqlite3_free(errMsg);
            m_state.store(State::Unavailable);
            return prep;
        }

        if (!existed) {
            if (sqlite3_exec(db, kLexicalIndexRebuild, nullptr, nullptr, &errMsg) != SQLITE_OK) {
                LOG_WARN(mcIndex, "Lexical index initial build failed: %s",
                         errMsg ? errMsg : "unknown");
                sqlite3_free(errMsg);
                m_state.store(State::Unavailable);
                return prep;
            }
            prep.rebuiltNow = true;
            LOG_INFO(mcIndex, "Lexical index created");
        }

        if (!existed && inTransaction) {
            // Stay Uninitialized so the next caller re-checks the table once
            // the enclosing write has committed or rolled back.
            prep.ready = true;
            return prep;
        }
        m_state.store(State::Ready);
        prep.ready = true;
        return prep;
    });
}

bool LexicalIndex::ensureIndex()
{
    return prepare().ready;
}

QString LexicalIndex::sanitizeQuery(const QString& query)
{
    static const QRegularExpression specialChars(QStringLiteral("['\"*(){}\\[\\]^~\\\\:]"));
    QString stripped = query;
    stripped.replace(specialChars, QStringLiteral(" "));

    const QStringList words = stripped.split(QRegularExpression(QStringLiteral("\\s+")),
                                             Qt::SkipEmptyParts);
    QStringList quoted;
    quoted.reserve(words.size());
    for (const QString& word : words) {
        quoted.append(QLatin1Char('"') + word + QLatin1Char('"'));
    }
    return quoted.join(QStringLiteral(" OR "));
}

std::optional<QStringList> LexicalIndex::search(const QString& projectId,
                                                const QString& query,
                                                int limit)
{
    if (!ensureIndex()) {
        return std::nullopt;
    }

    const QString sanitized = sanitizeQuery(query);
    if (sanitized.isEmpty()) {
        LOG_DEBUG(mcIndex, "Lexical search skipped after sanitization");
        return std::nullopt;
    }
    if (limit <= 0) {
        return QStringList();
    }

    return m_store->withConnection([&](sqlite3* db) -> std::optional<QStringList> {
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(db, kLexicalIndexSearch, -1, &stmt, nullptr) != SQLITE_OK) {
            LOG_ERROR(mcIndex, "Lexical search prepare: %s", sqlite3_errmsg(db));
            return std::nullopt;
        }

        const QByteArray queryUtf8 = sanitized.toUtf8();
        const QByteArray projectUtf8 = projectId.toUtf8();
        sqlite3_bind_text(stmt, 1, queryUtf8.constData(), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt, 2, projectUtf8.constData(), -1, SQLITE_STATIC);
        sqlite3_bind_int(stmt, 3, limit);

        QStringList ids;
        int rc = SQLITE_ROW;
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
            const char* id = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
            if (id) {
                ids.append(QString::fromUtf8(id));
            }
        }
        sqlite3_finalize(stmt);

        if (rc != SQLITE_DONE) {
            LOG_WARN(mcIndex, "Lexical search failed: %s", sqlite3_errmsg(db));
            return std::nullopt;
        }
        return ids;
    });
}

bool LexicalIndex::rebuild()
{
    const Preparation prep = prepare();
    if (!prep.ready) {
        return false;
    }
    if (prep.rebuiltNow) {
        return true;
    }

    const bool ok = m_store->execSql(kLexicalIndexRebuild);
    if (ok) {
        LOG_INFO(mcIndex, "Lexical index rebuilt");
    }
    return ok;
}

bool LexicalIndex::indexRecord(const char* sql, const MemoryRecord& record)
{
    return m_store->withConnection([&](sqlite3* db) {
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            LOG_ERROR(mcIndex, "Lexical index prepare: %s", sqlite3_errmsg(db));
            return false;
        }

        const QByteArray keyUtf8 = record.key.toUtf8();
        const QByteArray contentUtf8 = record.content.toUtf8();
        const QByteArray tagsUtf8 = encodeTags(record.tags).toUtf8();
        sqlite3_bind_int64(stmt, 1, record.rowId);
        sqlite3_bind_text(stmt, 2, keyUtf8.constData(), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt, 3, contentUtf8.constData(), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt, 4, tagsUtf8.constData(), -1, SQLITE_STATIC);

        const int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE) {
            LOG_WARN(mcIndex, "Lexical index write failed for memory %s: %s",
                     qPrintable(record.id), sqlite3_errmsg(db));
            // Re-check the table on next use; the enclosing write rolls back.
            m_state.store(State::Uninitialized);
            return false;
        }
        return true;
    });
}

// Write hooks run after the row statement. When prepare() had to create the
// table, its initial build already reflects this write.

bool LexicalIndex::onInsert(const MemoryRecord& inserted)
{
    const Preparation prep = prepare();
    if (!prep.ready || prep.rebuiltNow) {
        return true;
    }
    return indexRecord(kLexicalIndexInsert, inserted);
}

bool LexicalIndex::onUpdate(const MemoryRecord& before, const MemoryRecord& after)
{
    const Preparation prep = prepare();
    if (!prep.ready || prep.rebuiltNow) {
        return true;
    }
    return indexRecord(kLexicalIndexDelete, before) && indexRecord(kLexicalIndexInsert, after);
}

bool LexicalIndex::onDelete(const MemoryRecord& removed)
{
    const Preparation prep = prepare();
    if (!prep.ready || prep.rebuiltNow) {
        return true;
    }
    return indexRecord(kLexicalIndexDelete, removed);
}

} // namespace mc
