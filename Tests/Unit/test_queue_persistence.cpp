#include <QtTest/QtTest>
#include "core/indexing/queue_job.h"
#include "core/indexing/queue_persistence.h"

#include <QDir>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QSet>
#include <QTemporaryDir>

class TestQueuePersistence : public QObject {
    Q_OBJECT

private:
    static ss::QueueJob makeJob(const QString& filePath, int attempts = 0,
                                ss::JobStatus status = ss::JobStatus::Pending)
    {
        ss::QueueJob job;
        job.id = ss::generateJobId();
        job.stage = QStringLiteral("embedding");
        job.payload[QStringLiteral("filePath")] = filePath;
        job.attempts = attempts;
        job.status = status;
        job.enqueuedAt = 1700000000000LL;
        return job;
    }

private slots:
    // ── Job records ──────────────────────────────────────────────
    void testJobJsonRoundTripKeepsDiagnostics();
    void testJobWithoutIdRejected();
    void testGeneratedIdsAreUnique();

    // ── JSON files ───────────────────────────────────────────────
    void testJsonFileNames();
    void testJsonSaveAndLoad();
    void testJsonMissingFilesLoadEmpty();
    void testJsonCorruptFileMovedAside();
    void testJsonSkipsMalformedRecords();

    // ── SQLite ───────────────────────────────────────────────────
    void testSqliteSaveAndLoad();
    void testSqliteStagesAreIsolated();
    void testSqliteCorruptDatabaseRecreated();
    void testSqliteImportsLegacyJsonFiles();
    void testSqliteReadsJsonWhenDatabaseUnusable();

    // ── Factory ──────────────────────────────────────────────────
    void testFactorySelectsBackend();
};

// ── Job records ──────────────────────────────────────────────────

void TestQueuePersistence::testJobJsonRoundTripKeepsDiagnostics()
{
    ss::QueueJob job = makeJob(QStringLiteral("/docs/a.txt"), 4, ss::JobStatus::Failed);
    job.notBefore = 1700000005000LL;
    job.failedAt = 1700000009000LL;
    job.lastError = QStringLiteral("non_finite_value");

    const QJsonObject json = ss::queueJobToJson(job);
    QCOMPARE(json.value(QStringLiteral("status")).toString(), QStringLiteral("failed"));

    const auto restored = ss::queueJobFromJson(json);
    QVERIFY(restored.has_value());
    QCOMPARE(restored->id, job.id);
    QCOMPARE(restored->filePath(), QStringLiteral("/docs/a.txt"));
    QCOMPARE(restored->attempts, 4);
    QCOMPARE(restored->status, ss::JobStatus::Failed);
    QCOMPARE(restored->notBefore, job.notBefore);
    QCOMPARE(restored->failedAt, job.failedAt);
    QCOMPARE(restored->lastError, job.lastError);
}

void TestQueuePersistence::testJobWithoutIdRejected()
{
    QJsonObject json;
    json[QStringLiteral("stage")] = QStringLiteral("embedding");
    QVERIFY(!ss::queueJobFromJson(json).has_value());
}

void TestQueuePersistence::testGeneratedIdsAreUnique()
{
    QSet<QString> ids;
    for (int i = 0; i < 100; ++i) {
        ids.insert(ss::generateJobId());
    }
    QCOMPARE(ids.size(), 100);
}

// ── JSON files ───────────────────────────────────────────────────

void TestQueuePersistence::testJsonFileNames()
{
    ss::JsonQueuePersistence persistence(QStringLiteral("/data"), QStringLiteral("embedding"));
    QCOMPARE(persistence.pendingFilePath(), QStringLiteral("/data/embedding-queue.json"));
    QCOMPARE(persistence.deadLetterFilePath(), QStringLiteral("/data/embedding-dead-letter.json"));
}

void TestQueuePersistence::testJsonSaveAndLoad()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());
    ss::JsonQueuePersistence persistence(tempDir.path(), QStringLiteral("embedding"));

    const std::vector<ss::QueueJob> pending{makeJob(QStringLiteral("/a")), makeJob(QStringLiteral("/b"))};
    const std::vector<ss::QueueJob> dead{makeJob(QStringLiteral("/c"), 4, ss::JobStatus::Failed)};
    QVERIFY(persistence.savePending(pending));
    QVERIFY(persistence.saveDeadLetters(dead));

    const auto loadedPending = persistence.loadPending();
    QCOMPARE(static_cast<int>(loadedPending.size()), 2);
    QCOMPARE(loadedPending[0].id, pending[0].id);
    QCOMPARE(loadedPending[1].filePath(), QStringLiteral("/b"));

    const auto loadedDead = persistence.loadDeadLetters();
    QCOMPARE(static_cast<int>(loadedDead.size()), 1);
    QCOMPARE(loadedDead[0].attempts, 4);

    // Saving an empty list clears the stage
    QVERIFY(persistence.savePending({}));
    QVERIFY(persistence.loadPending().empty());
}

void TestQueuePersistence::testJsonMissingFilesLoadEmpty()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());
    ss::JsonQueuePersistence persistence(tempDir.path(), QStringLiteral("organize"));
    QVERIFY(persistence.loadPending().empty());
    QVERIFY(persistence.loadDeadLetters().empty());
}

void TestQueuePersistence::testJsonCorruptFileMovedAside()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());
    ss::JsonQueuePersistence persistence(tempDir.path(), QStringLiteral("embedding"));
    {
        QFile file(persistence.pendingFilePath());
        QVERIFY(file.open(QIODevice::WriteOnly));
        file.write("[{\"id\": \"truncated");
    }

    QVERIFY(persistence.loadPending().empty());
    QVERIFY(!QFile::exists(persistence.pendingFilePath()));
    const QStringList aside = QDir(tempDir.path())
                                  .entryList({QStringLiteral("embedding-queue.json.corrupt.*")},
                                             QDir::Files);
    QCOMPARE(aside.size(), 1);

    // The next save starts clean
    QVERIFY(persistence.savePending({makeJob(QStringLiteral("/x"))}));
    QCOMPARE(static_cast<int>(persistence.loadPending().size()), 1);
}

void TestQueuePersistence::testJsonSkipsMalformedRecords()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());
    ss::JsonQueuePersistence persistence(tempDir.path(), QStringLiteral("embedding"));

    QJsonArray array;
    array.append(ss::queueJobToJson(makeJob(QStringLiteral("/ok"))));
    array.append(QJsonObject{{QStringLiteral("stage"), QStringLiteral("embedding")}});
    array.append(QStringLiteral("not an object"));
    {
        QFile file(persistence.pendingFilePath());
        QVERIFY(file.open(QIODevice::WriteOnly));
        file.write(QJsonDocument(array).toJson());
    }

    const auto loaded = persistence.loadPending();
    QCOMPARE(static_cast<int>(loaded.size()), 1);
    QCOMPARE(loaded[0].filePath(), QStringLiteral("/ok"));
}

// ── SQLite ───────────────────────────────────────────────────────

void TestQueuePersistence::testSqliteSaveAndLoad()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());
    std::vector<ss::QueueJob> pending{makeJob(QStringLiteral("/a"))};
    {
        ss::SqliteQueuePersistence persistence(tempDir.path(), QStringLiteral("embedding"));
        QVERIFY(persistence.isOpen());
        QCOMPARE(persistence.location(), QDir(tempDir.path()).filePath(QStringLiteral("stage-queues.db")));
        QVERIFY(persistence.savePending(pending));
        QVERIFY(persistence.saveDeadLetters({makeJob(QStringLiteral("/dead"), 4, ss::JobStatus::Failed)}));
    }

    // Reopen to prove the rows are durable
    ss::SqliteQueuePersistence reopened(tempDir.path(), QStringLiteral("embedding"));
    const auto loaded = reopened.loadPending();
    QCOMPARE(static_cast<int>(loaded.size()), 1);
    QCOMPARE(loaded[0].id, pending[0].id);
    QCOMPARE(static_cast<int>(reopened.loadDeadLetters().size()), 1);
}

void TestQueuePersistence::testSqliteStagesAreIsolated()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());
    ss::SqliteQueuePersistence embedding(tempDir.path(), QStringLiteral("embedding"));
    ss::SqliteQueuePersistence organize(tempDir.path(), QStringLiteral("organize"));

    QVERIFY(embedding.savePending({makeJob(QStringLiteral("/e1")), makeJob(QStringLiteral("/e2"))}));
    QVERIFY(organize.savePending({makeJob(QStringLiteral("/o1"))}));

    QCOMPARE(static_cast<int>(embedding.loadPending().size()), 2);
    QCOMPARE(static_cast<int>(organize.loadPending().size()), 1);
    QVERIFY(organize.loadDeadLetters().empty());
}

void TestQueuePersistence::testSqliteCorruptDatabaseRecreated()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());
    const QString dbPath = QDir(tempDir.path()).filePath(QStringLiteral("stage-queues.db"));
    {
        QFile file(dbPath);
        QVERIFY(file.open(QIODevice::WriteOnly));
        file.write(QByteArray(4096, 'x'));
    }

    ss::SqliteQueuePersistence persistence(tempDir.path(), QStringLiteral("embedding"));
    QVERIFY(persistence.isOpen());
    QVERIFY(persistence.loadPending().empty());
    QVERIFY(persistence.savePending({makeJob(QStringLiteral("/after"))}));
    QCOMPARE(static_cast<int>(persistence.loadPending().size()), 1);

    const QStringList aside = QDir(tempDir.path())
                                  .entryList({QStringLiteral("stage-queues.db.corrupt.*")},
                                             QDir::Files);
    QCOMPARE(aside.size(), 1);
}

void TestQueuePersistence::testSqliteImportsLegacyJsonFiles()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());
    const ss::QueueJob pendingJob = makeJob(QStringLiteral("/legacy/a"));
    const ss::QueueJob deadJob = makeJob(QStringLiteral("/legacy/dead"), 4, ss::JobStatus::Failed);
    {
        ss::JsonQueuePersistence legacy(tempDir.path(), QStringLiteral("embedding"));
        QVERIFY(legacy.savePending({pendingJob}));
        QVERIFY(legacy.saveDeadLetters({deadJob}));
    }

    {
        ss::SqliteQueuePersistence persistence(tempDir.path(), QStringLiteral("embedding"));
        QVERIFY(persistence.isOpen());
        const auto pending = persistence.loadPending();
        QCOMPARE(static_cast<int>(pending.size()), 1);
        QCOMPARE(pending[0].id, pendingJob.id);
        const auto dead = persistence.loadDeadLetters();
        QCOMPARE(static_cast<int>(dead.size()), 1);
        QCOMPARE(dead[0].id, deadJob.id);
        QCOMPARE(dead[0].status, ss::JobStatus::Failed);
    }

    const QDir dir(tempDir.path());
    QVERIFY(!dir.exists(QStringLiteral("embedding-queue.json")));
    QVERIFY(!dir.exists(QStringLiteral("embedding-dead-letter.json")));
    QCOMPARE(dir.entryList({QStringLiteral("embedding-queue.json.legacy.*")}, QDir::Files).size(), 1);
    QCOMPARE(dir.entryList({QStringLiteral("embedding-dead-letter.json.legacy.*")}, QDir::Files).size(), 1);

    // Second start reads the imported rows from the database
    ss::SqliteQueuePersistence reopened(tempDir.path(), QStringLiteral("embedding"));
    const auto pending = reopened.loadPending();
    QCOMPARE(static_cast<int>(pending.size()), 1);
    QCOMPARE(pending[0].filePath(), QStringLiteral("/legacy/a"));
    QCOMPARE(static_cast<int>(reopened.loadDeadLetters().size()), 1);
}

void TestQueuePersistence::testSqliteReadsJsonWhenDatabaseUnusable()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());
    const ss::QueueJob pendingJob = makeJob(QStringLiteral("/fallback/a"));
    {
        ss::JsonQueuePersistence legacy(tempDir.path(), QStringLiteral("embedding"));
        QVERIFY(legacy.savePending({pendingJob}));
    }
    // A directory where the database file belongs cannot be opened
    QVERIFY(QDir(tempDir.path()).mkdir(QStringLiteral("stage-queues.db")));

    ss::SqliteQueuePersistence persistence(tempDir.path(), QStringLiteral("embedding"));
    QVERIFY(!persistence.isOpen());
    const auto pending = persistence.loadPending();
    QCOMPARE(static_cast<int>(pending.size()), 1);
    QCOMPARE(pending[0].id, pendingJob.id);
    QVERIFY(persistence.loadDeadLetters().empty());

    // The JSON file stays in place for the next start
    QVERIFY(QDir(tempDir.path()).exists(QStringLiteral("embedding-queue.json")));
    QVERIFY(!persistence.savePending({}));
}

// ── Factory ──────────────────────────────────────────────────────

void TestQueuePersistence::testFactorySelectsBackend()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());

    auto json = ss::makeQueuePersistence(ss::QueueBackend::JsonFiles, tempDir.path(),
                                         QStringLiteral("embedding"));
    QVERIFY(dynamic_cast<ss::JsonQueuePersistence*>(json.get()) != nullptr);

    auto sqlite = ss::makeQueuePersistence(ss::QueueBackend::Sqlite, tempDir.path(),
                                           QStringLiteral("embedding"));
    QVERIFY(dynamic_cast<ss::SqliteQueuePersistence*>(sqlite.get()) != nullptr);
}

QTEST_MAIN(TestQueuePersistence)
#include "test_queue_persistence.moc"
