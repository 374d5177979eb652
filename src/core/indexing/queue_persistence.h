#pragma once

#include "core/indexing/queue_job.h"
#include "core/shared/types.h"

#include <QString>

#include <memory>
#include <mutex>
#include <vector>

struct sqlite3;

namespace ss {

// Durable storage for one stage's pending jobs and dead letters.
// Implementations replace the whole list on every save so a crash leaves
// either the previous or the new snapshot, never a mix.
class QueuePersistence {
public:
    virtual ~QueuePersistence() = default;

    // Missing or unreadable state loads as an empty list (logged).
    virtual std::vector<QueueJob> loadPending() = 0;
    virtual std::vector<QueueJob> loadDeadLetters() = 0;

    virtual bool savePending(const std::vector<QueueJob>& jobs) = 0;
    virtual bool saveDeadLetters(const std::vector<QueueJob>& jobs) = 0;

    virtual QString location() const = 0;
};

// <dir>/<stage>-queue.json and <dir>/<stage>-dead-letter.json, each a JSON
// array of job records written through QSaveFile.
class JsonQueuePersistence : public QueuePersistence {
public:
    JsonQueuePersistence(const QString& dir, const QString& stage);

    std::vector<QueueJob> loadPending() override;
    std::vector<QueueJob> loadDeadLetters() override;
    bool savePending(const std::vector<QueueJob>& jobs) override;
    bool saveDeadLetters(const std::vector<QueueJob>& jobs) override;
    QString location() const override;

    QString pendingFilePath() const { return m_pendingPath; }
    QString deadLetterFilePath() const { return m_deadLetterPath; }

private:
    std::vector<QueueJob> loadFile(const QString& path, const QString& description);
    bool saveFile(const QString& path, const std::vector<QueueJob>& jobs, bool pretty);

    QString m_pendingPath;
    QString m_deadLetterPath;
};

// <dir>/stage-queues.db with one key/value row per (stage, list). Each save
// is a single-statement upsert, atomic under SQLite's journal.
//
// A list with no row yet is imported from the stage's JSON file, which is
// then renamed to "<file>.legacy.<epochMs>". When the database cannot be
// read the JSON file is loaded instead and left in place. A database found
// corrupt on open or read is renamed to "stage-queues.db.corrupt.<epochMs>"
// and recreated empty.
class SqliteQueuePersistence : public QueuePersistence {
public:
    SqliteQueuePersistence(const QString& dir, const QString& stage);
    ~SqliteQueuePersistence() override;

    SqliteQueuePersistence(const SqliteQueuePersistence&) = delete;
    SqliteQueuePersistence& operator=(const SqliteQueuePersistence&) = delete;

    std::vector<QueueJob> loadPending() override;
    std::vector<QueueJob> loadDeadLetters() override;
    bool savePending(const std::vector<QueueJob>& jobs) override;
    bool saveDeadLetters(const std::vector<QueueJob>& jobs) override;
    QString location() const override;

    bool isOpen() const;

private:
    enum class Lookup {
        Found,
        Missing,
        Failed,
    };

    bool open();
    void close();
    bool execSql(const char* sql);
    void backupCorruptDatabase(const char* reason);
    void recoverIfCorruptLocked(const char* reason);
    Lookup selectKeyLocked(const QString& key, QByteArray* blob);
    std::vector<QueueJob> loadKey(const QString& key, const QString& jsonPath);
    std::vector<QueueJob> importLegacyFileLocked(const QString& key, const QString& jsonPath);
    bool saveKey(const QString& key, const std::vector<QueueJob>& jobs);
    bool saveKeyLocked(const QString& key, const std::vector<QueueJob>& jobs);

    QString m_dbPath;
    QString m_pendingKey;
    QString m_deadLetterKey;
    QString m_pendingJsonPath;
    QString m_deadLetterJsonPath;
    sqlite3* m_db = nullptr;
    mutable std::mutex m_mutex;
};

std::unique_ptr<QueuePersistence> makeQueuePersistence(QueueBackend backend,
                                                       const QString& dir,
                                                       const QString& stage);

} // namespace ss
