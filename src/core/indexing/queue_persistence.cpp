#include "core/indexing/queue_persistence.h"
#include "core/shared/atomic_json_file.h"
#include "core/shared/logging.h"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>

#include <sqlite3.h>

namespace ss {

namespace {

constexpr const char* kSqliteDbName = "stage-queues.db";

constexpr const char* kConnectionPragmas = R"(
    PRAGMA journal_mode = WAL;
    PRAGMA synchronous = NORMAL;
)";

constexpr const char* kCreateTableSql = R"(
    CREATE TABLE IF NOT EXISTS stage_queue_kv (
        key        TEXT PRIMARY KEY,
        value      BLOB NOT NULL,
        updated_at INTEGER NOT NULL
    )
)";

constexpr const char* kSelectSql = "SELECT value FROM stage_queue_kv WHERE key = ?1";

constexpr const char* kUpsertSql = R"(
    INSERT INTO stage_queue_kv (key, value, updated_at) VALUES (?1, ?2, ?3)
    ON CONFLICT(key) DO UPDATE SET value = excluded.value, updated_at = excluded.updated_at
)";

QJsonArray jobsToArray(const std::vector<QueueJob>& jobs)
{
    QJsonArray array;
    for (const QueueJob& job : jobs) {
        array.append(queueJobToJson(job));
    }
    return array;
}

std::vector<QueueJob> jobsFromArray(const QJsonArray& array, const QString& source)
{
    std::vector<QueueJob> jobs;
    jobs.reserve(static_cast<size_t>(array.size()));
    int skipped = 0;
    for (const QJsonValue& value : array) {
        std::optional<QueueJob> job = queueJobFromJson(value.toObject());
        if (!job) {
            ++skipped;
            continue;
        }
        jobs.push_back(std::move(*job));
    }
    if (skipped > 0) {
        LOG_WARN(ssQueue, "Skipped %d malformed job records in %s", skipped, qUtf8Printable(source));
    }
    return jobs;
}

bool isCorruptionCode(int rc)
{
    const int primary = rc & 0xff;
    return primary == SQLITE_CORRUPT || primary == SQLITE_NOTADB;
}

QString pendingJsonPath(const QString& dir, const QString& stage)
{
    return QDir(dir).filePath(stage + QStringLiteral("-queue.json"));
}

QString deadLetterJsonPath(const QString& dir, const QString& stage)
{
    return QDir(dir).filePath(stage + QStringLiteral("-dead-letter.json"));
}

// Missing files load empty; unparsable ones are moved aside by atomic_json.
std::vector<QueueJob> loadJobsFile(const QString& path, const QString& description)
{
    const std::optional<QJsonDocument> doc = atomic_json::load(path, description);
    if (!doc) {
        return {};
    }
    if (!doc->isArray()) {
        LOG_ERROR(ssQueue, "Expected a JSON array in %s", qUtf8Printable(path));
        return {};
    }
    return jobsFromArray(doc->array(), path);
}

} // namespace

// ── JSON files ──────────────────────────────────────────────

JsonQueuePersistence::JsonQueuePersistence(const QString& dir, const QString& stage)
    : m_pendingPath(pendingJsonPath(dir, stage))
    , m_deadLetterPath(deadLetterJsonPath(dir, stage))
{
}

std::vector<QueueJob> JsonQueuePersistence::loadPending()
{
    return loadFile(m_pendingPath, QStringLiteral("pending queue"));
}

std::vector<QueueJob> JsonQueuePersistence::loadDeadLetters()
{
    return loadFile(m_deadLetterPath, QStringLiteral("dead-letter queue"));
}

bool JsonQueuePersistence::savePending(const std::vector<QueueJob>& jobs)
{
    return saveFile(m_pendingPath, jobs, false);
}

bool JsonQueuePersistence::saveDeadLetters(const std::vector<QueueJob>& jobs)
{
    return saveFile(m_deadLetterPath, jobs, true);
}

QString JsonQueuePersistence::location() const
{
    return m_pendingPath;
}

std::vector<QueueJob> JsonQueuePersistence::loadFile(const QString& path, const QString& description)
{
    return loadJobsFile(path, description);
}

bool JsonQueuePersistence::saveFile(const QString& path, const std::vector<QueueJob>& jobs, bool pretty)
{
    return atomic_json::write(path, QJsonDocument(jobsToArray(jobs)), pretty);
}

// ── SQLite key/value ────────────────────────────────────────

SqliteQueuePersistence::SqliteQueuePersistence(const QString& dir, const QString& stage)
    : m_dbPath(QDir(dir).filePath(QString::fromLatin1(kSqliteDbName)))
    , m_pendingKey(stage + QStringLiteral(":queue"))
    , m_deadLetterKey(stage + QStringLiteral(":deadLetter"))
    , m_pendingJsonPath(pendingJsonPath(dir, stage))
    , m_deadLetterJsonPath(deadLetterJsonPath(dir, stage))
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!QDir().mkpath(dir)) {
        LOG_ERROR(ssQueue, "Failed to create queue directory: %s", qUtf8Printable(dir));
        return;
    }
    if (!open()) {
        LOG_WARN(ssQueue, "Stage queue persistence disabled for %s", qUtf8Printable(m_pendingKey));
    }
}

SqliteQueuePersistence::~SqliteQueuePersistence()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    close();
}

bool SqliteQueuePersistence::isOpen() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_db != nullptr;
}

bool SqliteQueuePersistence::open()
{
    int rc = sqlite3_open(m_dbPath.toUtf8().constData(), &m_db);
    if (rc != SQLITE_OK) {
        LOG_ERROR(ssQueue, "Failed to open queue database %s: %s",
                  qUtf8Printable(m_dbPath), m_db ? sqlite3_errmsg(m_db) : "out of memory");
        close();
        return false;
    }

    sqlite3_busy_timeout(m_db, 5000);

    if (!execSql(kConnectionPragmas) || !execSql(kCreateTableSql)) {
        const int err = sqlite3_extended_errcode(m_db);
        if (isCorruptionCode(err)) {
            backupCorruptDatabase("schema setup failed");
            rc = sqlite3_open(m_dbPath.toUtf8().constData(), &m_db);
            if (rc == SQLITE_OK && execSql(kConnectionPragmas) && execSql(kCreateTableSql)) {
                return true;
            }
        }
        LOG_ERROR(ssQueue, "Queue database unusable: %s", qUtf8Printable(m_dbPath));
        close();
        return false;
    }
    return true;
}

void SqliteQueuePersistence::close()
{
    if (m_db != nullptr) {
        sqlite3_close(m_db);
        m_db = nullptr;
    }
}

bool SqliteQueuePersistence::execSql(const char* sql)
{
    char* errMsg = nullptr;
    const int rc = sqlite3_exec(m_db, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        LOG_ERROR(ssQueue, "SQL error: %s", errMsg ? errMsg : "unknown");
        sqlite3_free(errMsg);
        return false;
    }
    return true;
}

void SqliteQueuePersistence::backupCorruptDatabase(const char* reason)
{
    close();
    const QString backupPath = m_dbPath + QStringLiteral(".corrupt.")
                               + QString::number(QDateTime::currentMSecsSinceEpoch());
    if (QFile::rename(m_dbPath, backupPath)) {
        LOG_WARN(ssQueue, "Backed up corrupt queue database (%s): %s",
                 reason, qUtf8Printable(backupPath));
    } else {
        LOG_ERROR(ssQueue, "Failed to back up corrupt queue database: %s", qUtf8Printable(m_dbPath));
        atomic_json::removeIfExists(m_dbPath);
    }
    atomic_json::removeIfExists(m_dbPath + QStringLiteral("-wal"));
    atomic_json::removeIfExists(m_dbPath + QStringLiteral("-shm"));
}

void SqliteQueuePersistence::recoverIfCorruptLocked(const char* reason)
{
    if (m_db == nullptr || !isCorruptionCode(sqlite3_extended_errcode(m_db))) {
        return;
    }
    backupCorruptDatabase(reason);
    if (!open()) {
        LOG_ERROR(ssQueue, "Queue database could not be recreated: %s", qUtf8Printable(m_dbPath));
    }
}

std::vector<QueueJob> SqliteQueuePersistence::loadPending()
{
    return loadKey(m_pendingKey, m_pendingJsonPath);
}

std::vector<QueueJob> SqliteQueuePersistence::loadDeadLetters()
{
    return loadKey(m_deadLetterKey, m_deadLetterJsonPath);
}

bool SqliteQueuePersistence::savePending(const std::vector<QueueJob>& jobs)
{
    return saveKey(m_pendingKey, jobs);
}

bool SqliteQueuePersistence::saveDeadLetters(const std::vector<QueueJob>& jobs)
{
    return saveKey(m_deadLetterKey, jobs);
}

QString SqliteQueuePersistence::location() const
{
    return m_dbPath;
}

SqliteQueuePersistence::Lookup SqliteQueuePersistence::selectKeyLocked(const QString& key,
                                                                      QByteArray* blob)
{
    if (m_db == nullptr) {
        return Lookup::Failed;
    }

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kSelectSql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(ssQueue, "Queue load prepare failed: %s", sqlite3_errmsg(m_db));
        recoverIfCorruptLocked("load prepare failed");
        return Lookup::Failed;
    }

    const QByteArray keyUtf8 = key.toUtf8();
    sqlite3_bind_text(stmt, 1, keyUtf8.constData(), keyUtf8.size(), SQLITE_TRANSIENT);

    const int rc = sqlite3_step(stmt);
    Lookup result = Lookup::Missing;
    if (rc == SQLITE_ROW) {
        const void* data = sqlite3_column_blob(stmt, 0);
        const int size = sqlite3_column_bytes(stmt, 0);
        if (data != nullptr && size > 0) {
            *blob = QByteArray(static_cast<const char*>(data), size);
        }
        result = Lookup::Found;
    } else if (rc != SQLITE_DONE) {
        LOG_ERROR(ssQueue, "Queue load step failed: %s", sqlite3_errmsg(m_db));
        result = Lookup::Failed;
    }
    sqlite3_finalize(stmt);

    if (result == Lookup::Failed) {
        recoverIfCorruptLocked("load step failed");
    }
    return result;
}

std::vector<QueueJob> SqliteQueuePersistence::loadKey(const QString& key, const QString& jsonPath)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    QByteArray blob;
    switch (selectKeyLocked(key, &blob)) {
    case Lookup::Missing:
        return importLegacyFileLocked(key, jsonPath);
    case Lookup::Failed:
        LOG_WARN(ssQueue, "SQLite load failed for %s, falling back to %s",
                 qUtf8Printable(key), qUtf8Printable(jsonPath));
        return loadJobsFile(jsonPath, QStringLiteral("queue fallback"));
    case Lookup::Found:
        break;
    }

    if (blob.isEmpty()) {
        return {};
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(blob, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isArray()) {
        LOG_ERROR(ssQueue, "Queue blob for %s is not a JSON array: %s",
                  qUtf8Printable(key), qUtf8Printable(parseError.errorString()));
        return {};
    }
    return jobsFromArray(doc.array(), m_dbPath + QLatin1Char(':') + key);
}

std::vector<QueueJob> SqliteQueuePersistence::importLegacyFileLocked(const QString& key,
                                                                      const QString& jsonPath)
{
    if (!QFile::exists(jsonPath)) {
        return {};
    }

    std::vector<QueueJob> jobs = loadJobsFile(jsonPath, QStringLiteral("legacy queue file"));
    if (!QFile::exists(jsonPath)) {
        // Unparsable; atomic_json already moved it aside.
        return jobs;
    }
    if (!saveKeyLocked(key, jobs)) {
        LOG_WARN(ssQueue, "Legacy queue file %s not imported, leaving it in place",
                 qUtf8Printable(jsonPath));
        return jobs;
    }

    const QString archivedPath = jsonPath + QStringLiteral(".legacy.")
                                 + QString::number(QDateTime::currentMSecsSinceEpoch());
    if (QFile::rename(jsonPath, archivedPath)) {
        LOG_INFO(ssQueue, "Imported %d jobs from %s into %s",
                 static_cast<int>(jobs.size()), qUtf8Printable(jsonPath), qUtf8Printable(key));
    } else {
        LOG_WARN(ssQueue, "Imported %s but could not rename it to %s",
                 qUtf8Printable(jsonPath), qUtf8Printable(archivedPath));
    }
    return jobs;
}

bool SqliteQueuePersistence::saveKey(const QString& key, const std::vector<QueueJob>& jobs)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return saveKeyLocked(key, jobs);
}

bool SqliteQueuePersistence::saveKeyLocked(const QString& key, const std::vector<QueueJob>& jobs)
{
    if (m_db == nullptr) {
        LOG_ERROR(ssQueue, "Queue database not open, cannot persist %s", qUtf8Printable(key));
        return false;
    }

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kUpsertSql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(ssQueue, "Queue save prepare failed: %s", sqlite3_errmsg(m_db));
        return false;
    }

    const QByteArray keyUtf8 = key.toUtf8();
    const QByteArray payload = QJsonDocument(jobsToArray(jobs)).toJson(QJsonDocument::Compact);
    sqlite3_bind_text(stmt, 1, keyUtf8.constData(), keyUtf8.size(), SQLITE_TRANSIENT);
    sqlite3_bind_blob(stmt, 2, payload.constData(), payload.size(), SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 3, QDateTime::currentMSecsSinceEpoch());

    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        LOG_ERROR(ssQueue, "Queue save failed for %s: %s", qUtf8Printable(key), sqlite3_errmsg(m_db));
        return false;
    }
    return true;
}

std::unique_ptr<QueuePersistence> makeQueuePersistence(QueueBackend backend,
                                                       const QString& dir,
                                                       const QString& stage)
{
    if (backend == QueueBackend::Sqlite) {
        return std::make_unique<SqliteQueuePersistence>(dir, stage);
    }
    return std::make_unique<JsonQueuePersistence>(dir, stage);
}

} // namespace ss
