#include "core/index/memory_store.h"
#include "core/index/schema.h"
#include "core/shared/logging.h"

#include <QDateTime>
#include <QFile>
#include <QUuid>

#include <algorithm>
#include <cstring>

namespace mc {

namespace {

constexpr const char* kSelectColumns =
    "SELECT row_id, id, project_id, key, content, tags, embedding, archived_at, "
    "created_at, updated_at, revision, embedded_revision FROM memories ";

double nowSeconds()
{
    return static_cast<double>(QDateTime::currentMSecsSinceEpoch()) / 1000.0;
}

QString columnText(sqlite3_stmt* stmt, int column)
{
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, column));
    return text ? QString::fromUtf8(text) : QString();
}

MemoryRecord readRecord(sqlite3_stmt* stmt)
{
    MemoryRecord record;
    record.rowId = sqlite3_column_int64(stmt, 0);
    record.id = columnText(stmt, 1);
    record.projectId = columnText(stmt, 2);
    record.key = columnText(stmt, 3);
    record.content = columnText(stmt, 4);
    record.tags = decodeTags(columnText(stmt, 5));
    if (sqlite3_column_type(stmt, 6) != SQLITE_NULL) {
        record.embedding = columnText(stmt, 6);
    }
    if (sqlite3_column_type(stmt, 7) != SQLITE_NULL) {
        record.archivedAt = sqlite3_column_double(stmt, 7);
    }
    record.createdAt = sqlite3_column_double(stmt, 8);
    record.updatedAt = sqlite3_column_double(stmt, 9);
    record.revision = sqlite3_column_int64(stmt, 10);
    if (sqlite3_column_type(stmt, 11) != SQLITE_NULL) {
        record.embeddedRevision = sqlite3_column_int64(stmt, 11);
    }
    return record;
}

} // anonymous namespace

MemoryStore::~MemoryStore()
{
    if (m_db) {
        sqlite3_close(m_db);
        m_db = nullptr;
    }
}

std::unique_ptr<MemoryStore> MemoryStore::open(const QString& dbPath)
{
    std::unique_ptr<MemoryStore> store(new MemoryStore());
    if (!store->init(dbPath)) {
        return nullptr;
    }
    return store;
}

bool MemoryStore::init(const QString& dbPath)
{
    const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    int rc = sqlite3_open_v2(dbPath.toUtf8().constData(), &m_db, flags, nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERROR(mcIndex, "Failed to open database: %s",
                  m_db ? sqlite3_errmsg(m_db) : "out of memory");
        return false;
    }

    // Set busy_timeout FIRST via C API, before running any SQL.
    sqlite3_busy_timeout(m_db, 30000);

    if (!execSql(kConnectionPragmas)) {
        LOG_ERROR(mcIndex, "Failed to set connection pragmas");
        return false;
    }

    int userVersion = 0;
    {
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(m_db, "PRAGMA user_version", -1, &stmt, nullptr) == SQLITE_OK
            && sqlite3_step(stmt) == SQLITE_ROW) {
            userVersion = sqlite3_column_int(stmt, 0);
        }
        sqlite3_finalize(stmt);
    }

    if (userVersion > kCurrentSchemaVersion) {
        LOG_ERROR(mcIndex, "Database schema version %d is newer than supported %d",
                  userVersion, kCurrentSchemaVersion);
        return false;
    }

    if (userVersion == 0) {
        // First open: set database-level pragmas (requires write lock)
        if (!execSql(kDatabasePragmas)) {
            LOG_ERROR(mcIndex, "Failed to set database pragmas");
            return false;
        }

        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(m_db, "PRAGMA journal_mode", -1, &stmt, nullptr) == SQLITE_OK
            && sqlite3_step(stmt) == SQLITE_ROW) {
            const char* mode = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
            if (mode && std::strcmp(mode, "wal") != 0) {
                LOG_WARN(mcIndex, "Expected WAL journal mode, got: %s", mode);
            }
        }
        sqlite3_finalize(stmt);
    }

    if (userVersion == 1) {
        if (!beginTransaction()) {
            return false;
        }
        if (!execSql(kMigrateV1ToV2) || !commitTransaction()) {
            LOG_ERROR(mcIndex, "Failed to migrate schema from version 1");
            rollbackTransaction();
            return false;
        }
        LOG_INFO(mcIndex, "Migrated schema to version %d", kCurrentSchemaVersion);
    }

    if (!execSql(kSchema)) {
        LOG_ERROR(mcIndex, "Failed to create schema");
        return false;
    }

    // Restrict database file permissions to owner-only (0600)
    QFile dbFile(dbPath);
    dbFile.setPermissions(QFile::ReadOwner | QFile::WriteOwner);

    LOG_INFO(mcIndex, "Database opened successfully: %s", dbPath.toUtf8().constData());
    return true;
}

bool MemoryStore::execSql(const char* sql)
{
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    char* errMsg = nullptr;
    const int rc = sqlite3_exec(m_db, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        LOG_ERROR(mcIndex, "SQL error: %s", errMsg ? errMsg : "unknown");
        sqlite3_free(errMsg);
        return false;
    }
    return true;
}

void MemoryStore::addWriteHook(MemoryWriteHook* hook)
{
    if (!hook) {
        return;
    }
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    if (std::find(m_hooks.begin(), m_hooks.end(), hook) == m_hooks.end()) {
        m_hooks.push_back(hook);
    }
}

void MemoryStore::removeWriteHook(MemoryWriteHook* hook)
{
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    m_hooks.erase(std::remove(m_hooks.begin(), m_hooks.end(), hook), m_hooks.end());
}

bool MemoryStore::runHooks(WriteKind kind, const MemoryRecord* before, const MemoryRecord& after)
{
    for (MemoryWriteHook* hook : m_hooks) {
        bool ok = true;
        switch (kind) {
        case WriteKind::Insert:
            ok = hook->onInsert(after);
            break;
        case WriteKind::Update:
            ok = hook->onUpdate(*before, after);
            break;
        case WriteKind::Delete:
            ok = hook->onDelete(after);
            break;
        }
        if (!ok) {
            LOG_WARN(mcIndex, "Write hook rejected %s of memory %s",
                     qPrintable(writeKindToString(kind)), qPrintable(after.id));
            return false;
        }
    }
    return true;
}

void MemoryStore::notifyCommitted(WriteKind kind, const MemoryRecord& record)
{
    std::vector<MemoryWriteHook*> hooks;
    {
        std::lock_guard<std::recursive_mutex> lock(m_mutex);
        hooks = m_hooks;
    }
    for (MemoryWriteHook* hook : hooks) {
        hook->onCommitted(kind, record);
    }
}

// ── Memories ────────────────────────────────────────────────

std::optional<MemoryRecord> MemoryStore::insertMemory(const QString& projectId,
                                                      const QString& key,
                                                      const QString& content,
                                                      const QStringList& tags)
{
    MemoryRecord record;
    record.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    record.projectId = projectId;
    record.key = key;
    record.content = content;
    record.tags = tags;
    record.createdAt = nowSeconds();
    record.updatedAt = record.createdAt;

    {
        std::lock_guard<std::recursive_mutex> lock(m_mutex);
        if (!beginTransaction()) {
            return std::nullopt;
        }

        const char* sql = R"(
            INSERT INTO memories (id, project_id, key, content, tags, created_at, updated_at)
            VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7)
        )";
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            LOG_ERROR(mcIndex, "insertMemory prepare: %s", sqlite3_errmsg(m_db));
            rollbackTransaction();
            return std::nullopt;
        }

        const QByteArray idUtf8 = record.id.toUtf8();
        const QByteArray projectUtf8 = projectId.toUtf8();
        const QByteArray keyUtf8 = key.toUtf8();
        const QByteArray contentUtf8 = content.toUtf8();
        const QByteArray tagsUtf8 = encodeTags(tags).toUtf8();
        sqlite3_bind_text(stmt, 1, idUtf8.constData(), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt, 2, projectUtf8.constData(), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt, 3, keyUtf8.constData(), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt, 4, contentUtf8.constData(), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt, 5, tagsUtf8.constData(), -1, SQLITE_STATIC);
        sqlite3_bind_double(stmt, 6, record.createdAt);
        sqlite3_bind_double(stmt, 7, record.updatedAt);

        const int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE) {
            LOG_WARN(mcIndex, "insertMemory failed for key '%s': %s",
                     qPrintable(key), sqlite3_errmsg(m_db));
            rollbackTransaction();
            return std::nullopt;
        }
        record.rowId = sqlite3_last_insert_rowid(m_db);

        if (!runHooks(WriteKind::Insert, nullptr, record) || !commitTransaction()) {
            rollbackTransaction();
            return std::nullopt;
        }
    }

    notifyCommitted(WriteKind::Insert, record);
    return record;
}

std::optional<MemoryRecord> MemoryStore::updateMemory(const QString& id, const MemoryUpdate& update)
{
    MemoryRecord after;
    {
        std::lock_guard<std::recursive_mutex> lock(m_mutex);
        if (!beginTransaction()) {
            return std::nullopt;
        }

        const std::optional<MemoryRecord> before = getMemoryLocked(id);
        if (!before) {
            rollbackTransaction();
            return std::nullopt;
        }

        after = *before;
        if (update.key) after.key = *update.key;
        if (update.content) after.content = *update.content;
        if (update.tags) after.tags = *update.tags;

        if (after.key == before->key && after.content == before->content
            && after.tags == before->tags) {
            rollbackTransaction();
            return before;
        }
        after.updatedAt = nowSeconds();
        after.revision = before->revision + 1;

        const char* sql = R"(
            UPDATE memories
            SET key = ?1, content = ?2, tags = ?3, updated_at = ?4, revision = ?5
            WHERE row_id = ?6
        )";
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            LOG_ERROR(mcIndex, "updateMemory prepare: %s", sqlite3_errmsg(m_db));
            rollbackTransaction();
            return std::nullopt;
        }

        const QByteArray keyUtf8 = after.key.toUtf8();
        const QByteArray contentUtf8 = after.content.toUtf8();
        const QByteArray tagsUtf8 = encodeTags(after.tags).toUtf8();
        sqlite3_bind_text(stmt, 1, keyUtf8.constData(), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt, 2, contentUtf8.constData(), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt, 3, tagsUtf8.constData(), -1, SQLITE_STATIC);
        sqlite3_bind_double(stmt, 4, after.updatedAt);
        sqlite3_bind_int64(stmt, 5, after.revision);
        sqlite3_bind_int64(stmt, 6, after.rowId);

        const int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE) {
            LOG_WARN(mcIndex, "updateMemory failed for %s: %s",
                     qPrintable(id), sqlite3_errmsg(m_db));
            rollbackTransaction();
            return std::nullopt;
        }

        if (!runHooks(WriteKind::Update, &before.value(), after) || !commitTransaction()) {
            rollbackTransaction();
            return std::nullopt;
        }
    }

    notifyCommitted(WriteKind::Update, after);
    return after;
}

bool MemoryStore::deleteMemory(const QString& id)
{
    MemoryRecord removed;
    {
        std::lock_guard<std::recursive_mutex> lock(m_mutex);
        if (!beginTransaction()) {
            return false;
        }

        const std::optional<MemoryRecord> existing = getMemoryLocked(id);
        if (!existing) {
            rollbackTransaction();
            return false;
        }
        removed = *existing;

        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(m_db, "DELETE FROM memories WHERE row_id = ?1", -1, &stmt,
                               nullptr) != SQLITE_OK) {
            LOG_ERROR(mcIndex, "deleteMemory prepare: %s", sqlite3_errmsg(m_db));
            rollbackTransaction();
            return false;
        }
        sqlite3_bind_int64(stmt, 1, removed.rowId);
        const int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE) {
            LOG_WARN(mcIndex, "deleteMemory failed for %s: %s",
                     qPrintable(id), sqlite3_errmsg(m_db));
            rollbackTransaction();
            return false;
        }

        if (!runHooks(WriteKind::Delete, nullptr, removed) || !commitTransaction()) {
            rollbackTransaction();
            return false;
        }
    }

    notifyCommitted(WriteKind::Delete, removed);
    return true;
}

bool MemoryStore::archiveMemory(const QString& id)
{
    return archiveMemory(id, nowSeconds());
}

bool MemoryStore::archiveMemory(const QString& id, double archivedAt)
{
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    const char* sql = "UPDATE memories SET archived_at = ?1 WHERE id = ?2 AND archived_at IS NULL";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(mcIndex, "archiveMemory prepare: %s", sqlite3_errmsg(m_db));
        return false;
    }
    const QByteArray idUtf8 = id.toUtf8();
    sqlite3_bind_double(stmt, 1, archivedAt);
    sqlite3_bind_text(stmt, 2, idUtf8.constData(), -1, SQLITE_STATIC);
    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    return rc == SQLITE_DONE && sqlite3_changes(m_db) > 0;
}

std::optional<MemoryRecord> MemoryStore::getMemory(const QString& id)
{
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    return getMemoryLocked(id);
}

std::optional<MemoryRecord> MemoryStore::getMemoryLocked(const QString& id)
{
    const QByteArray sql = QByteArray(kSelectColumns) + "WHERE id = ?1";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql.constData(), -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(mcIndex, "getMemory prepare: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }
    const QByteArray idUtf8 = id.toUtf8();
    sqlite3_bind_text(stmt, 1, idUtf8.constData(), -1, SQLITE_STATIC);

    std::optional<MemoryRecord> result;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        result = readRecord(stmt);
    }
    sqlite3_finalize(stmt);
    return result;
}

int64_t MemoryStore::countMemories()
{
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, "SELECT count(*) FROM memories", -1, &stmt, nullptr)
        != SQLITE_OK) {
        return 0;
    }
    int64_t count = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = sqlite3_column_int64(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return count;
}

// ── Embeddings ──────────────────────────────────────────────

std::vector<StoredEmbedding> MemoryStore::embeddingsForProject(const QString& projectId)
{
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    const char* sql = R"(
        SELECT id, embedding FROM memories
        WHERE project_id = ?1 AND archived_at IS NULL AND embedding IS NOT NULL
        ORDER BY row_id
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(mcIndex, "embeddingsForProject prepare: %s", sqlite3_errmsg(m_db));
        return {};
    }
    const QByteArray projectUtf8 = projectId.toUtf8();
    sqlite3_bind_text(stmt, 1, projectUtf8.constData(), -1, SQLITE_STATIC);

    std::vector<StoredEmbedding> rows;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        rows.push_back({columnText(stmt, 0), columnText(stmt, 1)});
    }
    sqlite3_finalize(stmt);
    return rows;
}

std::vector<MemoryRecord> MemoryStore::memoriesMissingEmbedding(int limit)
{
    if (limit <= 0) {
        return {};
    }

    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    const QByteArray sql = QByteArray(kSelectColumns)
        + "WHERE archived_at IS NULL AND (embedding IS NULL OR embedded_revision < revision) "
          "ORDER BY created_at, row_id LIMIT ?1";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql.constData(), -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(mcIndex, "memoriesMissingEmbedding prepare: %s", sqlite3_errmsg(m_db));
        return {};
    }
    sqlite3_bind_int(stmt, 1, limit);

    std::vector<MemoryRecord> rows;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        rows.push_back(readRecord(stmt));
    }
    sqlite3_finalize(stmt);
    return rows;
}

bool MemoryStore::updateEmbedding(const QString& id, const QString& serialized)
{
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    const char* sql = "UPDATE memories SET embedding = ?1, embedded_revision = revision WHERE id = ?2";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(mcIndex, "updateEmbedding prepare: %s", sqlite3_errmsg(m_db));
        return false;
    }
    const QByteArray embeddingUtf8 = serialized.toUtf8();
    const QByteArray idUtf8 = id.toUtf8();
    sqlite3_bind_text(stmt, 1, embeddingUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, idUtf8.constData(), -1, SQLITE_STATIC);
    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        LOG_WARN(mcIndex, "updateEmbedding failed for %s: %s",
                 qPrintable(id), sqlite3_errmsg(m_db));
        return false;
    }
    // A memory deleted since the job was queued is not an error.
    return sqlite3_changes(m_db) > 0;
}

bool MemoryStore::updateEmbedding(const QString& id, const QString& serialized, int64_t revision)
{
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    const char* sql = R"(
        UPDATE memories SET embedding = ?1, embedded_revision = ?3
        WHERE id = ?2 AND revision = ?3
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(mcIndex, "updateEmbedding prepare: %s", sqlite3_errmsg(m_db));
        return false;
    }
    const QByteArray embeddingUtf8 = serialized.toUtf8();
    const QByteArray idUtf8 = id.toUtf8();
    sqlite3_bind_text(stmt, 1, embeddingUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, idUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 3, revision);
    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        LOG_WARN(mcIndex, "updateEmbedding failed for %s: %s",
                 qPrintable(id), sqlite3_errmsg(m_db));
        return false;
    }
    if (sqlite3_changes(m_db) == 0) {
        LOG_DEBUG(mcIndex, "Embedding for %s at revision %lld is superseded or orphaned",
                  qPrintable(id), static_cast<long long>(revision));
        return false;
    }
    return true;
}

bool MemoryStore::updateEmbeddings(const std::vector<std::pair<QString, QString>>& embeddings)
{
    if (embeddings.empty()) {
        return true;
    }

    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    if (!beginTransaction()) {
        return false;
    }

    const char* sql = "UPDATE memories SET embedding = ?1, embedded_revision = revision WHERE id = ?2";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(mcIndex, "updateEmbeddings prepare: %s", sqlite3_errmsg(m_db));
        rollbackTransaction();
        return false;
    }

    for (const auto& [id, serialized] : embeddings) {
        const QByteArray embeddingUtf8 = serialized.toUtf8();
        const QByteArray idUtf8 = id.toUtf8();
        sqlite3_bind_text(stmt, 1, embeddingUtf8.constData(), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt, 2, idUtf8.constData(), -1, SQLITE_STATIC);
        if (sqlite3_step(stmt) != SQLITE_DONE) {
            LOG_WARN(mcIndex, "updateEmbeddings failed for %s: %s",
                     qPrintable(id), sqlite3_errmsg(m_db));
            sqlite3_finalize(stmt);
            rollbackTransaction();
            return false;
        }
        sqlite3_reset(stmt);
        sqlite3_clear_bindings(stmt);
    }
    sqlite3_finalize(stmt);
    return commitTransaction();
}

// ── Transactions ────────────────────────────────────────────

bool MemoryStore::beginTransaction()
{
    return execSql("BEGIN IMMEDIATE TRANSACTION");
}

bool MemoryStore::commitTransaction()
{
    return execSql("COMMIT");
}

bool MemoryStore::rollbackTransaction()
{
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    if (sqlite3_get_autocommit(m_db) != 0) {
        return true;  // nothing open
    }
    return execSql("ROLLBACK");
}

bool MemoryStore::integrityCheck()
{
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, "PRAGMA integrity_check;", -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }

    bool ok = false;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        const char* result = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
        ok = (result && std::strcmp(result, "ok") == 0);
    }
    sqlite3_finalize(stmt);
    return ok;
}

} // namespace mc
