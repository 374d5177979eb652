#include <QtTest/QtTest>
#include "core/indexing/queue_persistence.h"
#include "core/indexing/stage_queue.h"
#include "manual_clock.h"

#include <QTemporaryDir>

#include <atomic>
#include <memory>
#include <mutex>
#include <stdexcept>

namespace {

QJsonObject payloadFor(const QString& filePath)
{
    QJsonObject payload;
    payload[QStringLiteral("filePath")] = filePath;
    return payload;
}

// Storage shared across queue instances, standing in for the files a crashed
// process leaves behind. Writes can be made to fail per list.
class MemoryStorage {
public:
    std::vector<ss::QueueJob> pending() const { return read(m_pending); }
    std::vector<ss::QueueJob> deadLetters() const { return read(m_dead); }

    void setDeadLetters(std::vector<ss::QueueJob> jobs)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_dead = std::move(jobs);
    }

    void failPendingWrites(bool fail)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_failPending = fail;
    }

    void failDeadLetterWrites(bool fail)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_failDead = fail;
    }

    bool writePending(const std::vector<ss::QueueJob>& jobs)
    {
        return write(m_pending, jobs, m_failPending, QStringLiteral("pending"));
    }

    bool writeDeadLetters(const std::vector<ss::QueueJob>& jobs)
    {
        return write(m_dead, jobs, m_failDead, QStringLiteral("dead"));
    }

    // Every attempted write in order, failed ones included.
    QStringList writeLog() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_writes;
    }

private:
    std::vector<ss::QueueJob> read(const std::vector<ss::QueueJob>& list) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return list;
    }

    bool write(std::vector<ss::QueueJob>& list, const std::vector<ss::QueueJob>& jobs,
               const bool& fail, const QString& name)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_writes.append(name);
        if (fail) {
            return false;
        }
        list = jobs;
        return true;
    }

    mutable std::mutex m_mutex;
    std::vector<ss::QueueJob> m_pending;
    std::vector<ss::QueueJob> m_dead;
    bool m_failPending = false;
    bool m_failDead = false;
    QStringList m_writes;
};

class MemoryQueuePersistence : public ss::QueuePersistence {
public:
    explicit MemoryQueuePersistence(std::shared_ptr<MemoryStorage> storage)
        : m_storage(std::move(storage)) {}

    std::vector<ss::QueueJob> loadPending() override { return m_storage->pending(); }
    std::vector<ss::QueueJob> loadDeadLetters() override { return m_storage->deadLetters(); }
    QString location() const override { return QStringLiteral("memory"); }

    bool savePending(const std::vector<ss::QueueJob>& jobs) override
    {
        return m_storage->writePending(jobs);
    }

    bool saveDeadLetters(const std::vector<ss::QueueJob>& jobs) override
    {
        return m_storage->writeDeadLetters(jobs);
    }

private:
    std::shared_ptr<MemoryStorage> m_storage;
};

QStringList jobIds(const std::vector<ss::QueueJob>& jobs)
{
    QStringList ids;
    for (const ss::QueueJob& job : jobs) {
        ids.append(job.id);
    }
    return ids;
}

ss::StageQueueConfig fastConfig(const QString& stage = QStringLiteral("embedding"))
{
    ss::StageQueueConfig config;
    config.stage = stage;
    config.concurrency = 2;
    config.maxRetries = 2;
    config.retryBaseDelayMs = 0;
    return config;
}

} // namespace

class TestStageQueue : public QObject {
    Q_OBJECT

private slots:
    // ── Processing ───────────────────────────────────────────────
    void testProcessesEnqueuedJobs();
    void testStartRequiresHandler();
    void testRetryThenSuccess();
    void testRetryWaitsForBackoff();
    void testDeadLetterAfterMaxRetries();
    void testFailSkipsRetries();
    void testHandlerExceptionCountsAsRetry();

    // ── Admission ────────────────────────────────────────────────
    void testCapacityRefusesJobs();
    void testEnqueueRefusedAfterStop();
    void testPauseHoldsJobs();

    // ── Path maintenance ─────────────────────────────────────────
    void testUpdateAndRemoveByFilePath();

    // ── Dead letters ─────────────────────────────────────────────
    void testRetryDeadLetter();
    void testClearDeadLetters();
    void testDeadLetterListIsBounded();

    // ── Persistence ──────────────────────────────────────────────
    void testStopPersistsPendingJobs();
    void testActiveJobsRestoredAsPending();
    void testDeadLettersSurviveRestart();
    void testInterruptedDeadLetterCheckpointKeepsJob();
    void testInterruptedRequeueCheckpointKeepsJob();

    // ── Backoff ──────────────────────────────────────────────────
    void testRetryDelaySchedule();
};

// ── Processing ───────────────────────────────────────────────────

void TestStageQueue::testProcessesEnqueuedJobs()
{
    std::atomic<int> calls{0};
    ss::StageQueue queue(fastConfig());
    queue.setHandler([&calls](const ss::QueueJob& job) {
        if (job.filePath().isEmpty()) {
            return ss::JobOutcome::fail(QStringLiteral("missing path"));
        }
        ++calls;
        return ss::JobOutcome::success();
    });

    for (int i = 0; i < 20; ++i) {
        QVERIFY(!queue.enqueue(payloadFor(QStringLiteral("/docs/%1.txt").arg(i))).isEmpty());
    }
    QVERIFY(queue.start());
    QVERIFY(queue.isRunning());
    QVERIFY(!queue.start());

    QVERIFY(queue.waitForIdle(5000));
    QCOMPARE(calls.load(), 20);

    const ss::StageQueueStats stats = queue.stats();
    QCOMPARE(stats.processed, static_cast<uint64_t>(20));
    QCOMPARE(stats.size, static_cast<size_t>(0));
    QCOMPARE(stats.failed, static_cast<size_t>(0));

    queue.stop();
    QVERIFY(!queue.isRunning());
}

void TestStageQueue::testStartRequiresHandler()
{
    ss::StageQueue queue(fastConfig());
    QVERIFY(!queue.start());
    QVERIFY(!queue.isRunning());
}

void TestStageQueue::testRetryThenSuccess()
{
    std::atomic<int> calls{0};
    ss::StageQueue queue(fastConfig());
    queue.setHandler([&calls](const ss::QueueJob& job) {
        if (++calls == 1) {
            return ss::JobOutcome::retry(QStringLiteral("backend busy"));
        }
        return job.attempts == 1 ? ss::JobOutcome::success()
                                 : ss::JobOutcome::fail(QStringLiteral("attempts not tracked"));
    });

    QVERIFY(!queue.enqueue(payloadFor(QStringLiteral("/a"))).isEmpty());
    QVERIFY(queue.start());
    QTRY_COMPARE(queue.stats().processed, static_cast<uint64_t>(1));

    const ss::StageQueueStats stats = queue.stats();
    QCOMPARE(stats.retried, static_cast<uint64_t>(1));
    QCOMPARE(stats.failed, static_cast<size_t>(0));
    QCOMPARE(calls.load(), 2);
}

void TestStageQueue::testRetryWaitsForBackoff()
{
    ss::test::ManualClock clock;
    std::atomic<int> calls{0};

    ss::StageQueueConfig config = fastConfig();
    config.concurrency = 1;
    config.retryBaseDelayMs = 1000;
    config.clock = clock.fn();
    ss::StageQueue queue(config);
    queue.setHandler([&calls](const ss::QueueJob&) {
        if (++calls == 1) {
            return ss::JobOutcome::retry(QStringLiteral("timeout"));
        }
        return ss::JobOutcome::success();
    });

    queue.enqueue(payloadFor(QStringLiteral("/a")));
    QVERIFY(queue.start());
    QTRY_COMPARE(calls.load(), 1);

    // Still inside the backoff window
    QTest::qWait(200);
    QCOMPARE(calls.load(), 1);
    const std::vector<ss::QueueJob> pending = queue.pendingJobs();
    QCOMPARE(static_cast<int>(pending.size()), 1);
    QCOMPARE(pending[0].attempts, 1);
    QCOMPARE(pending[0].notBefore, clock.now() + 1000);
    QCOMPARE(pending[0].lastError, QStringLiteral("timeout"));

    clock.advance(1000);
    QTRY_COMPARE(calls.load(), 2);
    QVERIFY(queue.waitForIdle(2000));
}

void TestStageQueue::testDeadLetterAfterMaxRetries()
{
    std::atomic<int> calls{0};
    std::atomic<int> callbacks{0};
    ss::StageQueue queue(fastConfig());
    queue.setHandler([&calls](const ss::QueueJob&) {
        ++calls;
        return ss::JobOutcome::retry(QStringLiteral("still failing"));
    });
    queue.setDeadLetterCallback([&callbacks](const ss::QueueJob& job) {
        if (job.status == ss::JobStatus::Failed) {
            ++callbacks;
        }
    });

    const QString id = queue.enqueue(payloadFor(QStringLiteral("/a")));
    QVERIFY(queue.start());
    QTRY_COMPARE(callbacks.load(), 1);

    // First attempt plus maxRetries retries
    QCOMPARE(calls.load(), 3);

    const std::vector<ss::QueueJob> dead = queue.deadLetters();
    QCOMPARE(static_cast<int>(dead.size()), 1);
    QCOMPARE(dead[0].id, id);
    QCOMPARE(dead[0].attempts, 3);
    QCOMPARE(dead[0].lastError, QStringLiteral("still failing"));
    QVERIFY(dead[0].failedAt > 0);

    const ss::StageQueueStats stats = queue.stats();
    QCOMPARE(stats.retried, static_cast<uint64_t>(2));
    QCOMPARE(stats.deadLettered, static_cast<uint64_t>(1));
    QCOMPARE(stats.processed, static_cast<uint64_t>(0));
    QCOMPARE(stats.size, static_cast<size_t>(0));
}

void TestStageQueue::testFailSkipsRetries()
{
    std::atomic<int> calls{0};
    ss::StageQueueConfig config = fastConfig();
    config.maxRetries = 5;
    ss::StageQueue queue(config);
    queue.setHandler([&calls](const ss::QueueJob&) {
        ++calls;
        return ss::JobOutcome::fail(QStringLiteral("non_finite_value"));
    });

    queue.enqueue(payloadFor(QStringLiteral("/a")));
    QVERIFY(queue.start());
    QTRY_COMPARE(queue.stats().failed, static_cast<size_t>(1));

    QCOMPARE(calls.load(), 1);
    QCOMPARE(queue.deadLetters()[0].attempts, 1);
    QCOMPARE(queue.deadLetters()[0].lastError, QStringLiteral("non_finite_value"));
    QCOMPARE(queue.stats().retried, static_cast<uint64_t>(0));
}

void TestStageQueue::testHandlerExceptionCountsAsRetry()
{
    ss::StageQueueConfig config = fastConfig();
    config.maxRetries = 0;
    ss::StageQueue queue(config);
    queue.setHandler([](const ss::QueueJob&) -> ss::JobOutcome {
        throw std::runtime_error("boom");
    });

    queue.enqueue(payloadFor(QStringLiteral("/a")));
    QVERIFY(queue.start());
    QTRY_COMPARE(queue.stats().failed, static_cast<size_t>(1));
    QCOMPARE(queue.deadLetters()[0].lastError, QStringLiteral("boom"));
    QCOMPARE(queue.deadLetters()[0].attempts, 1);
}

// ── Admission ────────────────────────────────────────────────────

void TestStageQueue::testCapacityRefusesJobs()
{
    ss::StageQueueConfig config = fastConfig();
    config.maxQueueSize = 2;
    ss::StageQueue queue(config);

    QVERIFY(!queue.enqueue(payloadFor(QStringLiteral("/a"))).isEmpty());
    QVERIFY(!queue.enqueue(payloadFor(QStringLiteral("/b"))).isEmpty());
    QVERIFY(queue.enqueue(payloadFor(QStringLiteral("/c"))).isEmpty());

    const ss::StageQueueStats stats = queue.stats();
    QCOMPARE(stats.size, static_cast<size_t>(2));
    QCOMPARE(stats.dropped, static_cast<uint64_t>(1));
    QCOMPARE(stats.capacityPercent, 100.0);

    const std::vector<QString> ids = queue.enqueueBatch({payloadFor(QStringLiteral("/d"))});
    QCOMPARE(static_cast<int>(ids.size()), 1);
    QVERIFY(ids[0].isEmpty());
}

void TestStageQueue::testEnqueueRefusedAfterStop()
{
    ss::StageQueue queue(fastConfig());
    queue.setHandler([](const ss::QueueJob&) { return ss::JobOutcome::success(); });

    QVERIFY(queue.start());
    queue.stop();
    QVERIFY(queue.enqueue(payloadFor(QStringLiteral("/late"))).isEmpty());

    QVERIFY(queue.start());
    QVERIFY(!queue.enqueue(payloadFor(QStringLiteral("/again"))).isEmpty());
    QVERIFY(queue.waitForIdle(5000));
}

void TestStageQueue::testPauseHoldsJobs()
{
    std::atomic<int> calls{0};
    ss::StageQueue queue(fastConfig());
    queue.setHandler([&calls](const ss::QueueJob&) {
        ++calls;
        return ss::JobOutcome::success();
    });

    queue.pause();
    QVERIFY(queue.isPaused());
    QVERIFY(queue.start());
    queue.enqueue(payloadFor(QStringLiteral("/a")));
    queue.enqueue(payloadFor(QStringLiteral("/b")));

    QTest::qWait(150);
    QCOMPARE(calls.load(), 0);
    QVERIFY(queue.stats().paused);
    QVERIFY(!queue.waitForIdle(10));

    queue.resume();
    QVERIFY(!queue.isPaused());
    QVERIFY(queue.waitForIdle(5000));
    QCOMPARE(calls.load(), 2);
}

// ── Path maintenance ─────────────────────────────────────────────

void TestStageQueue::testUpdateAndRemoveByFilePath()
{
    ss::StageQueue queue(fastConfig());
    queue.enqueue(payloadFor(QStringLiteral("/in/a.txt")));
    queue.enqueue(payloadFor(QStringLiteral("/in/a.txt")));
    queue.enqueue(payloadFor(QStringLiteral("/in/b.txt")));

    QCOMPARE(queue.updateByFilePath(QStringLiteral("/in/a.txt"), QStringLiteral("/out/a.txt")), 2);
    QCOMPARE(queue.updateByFilePath(QStringLiteral("/in/a.txt"), QStringLiteral("/out/a.txt")), 0);
    QCOMPARE(queue.updateByFilePath(QStringLiteral("/in/b.txt"), QStringLiteral("/in/b.txt")), 0);

    int moved = 0;
    for (const ss::QueueJob& job : queue.pendingJobs()) {
        if (job.filePath() == QStringLiteral("/out/a.txt")) {
            ++moved;
        }
    }
    QCOMPARE(moved, 2);

    // The rewriter sees the payload after filePath has changed
    const int rewritten = queue.updateByFilePath(
        QStringLiteral("/out/a.txt"), QStringLiteral("/final/a.txt"), [](QJsonObject& payload) {
            payload[QStringLiteral("derived")] =
                payload.value(QStringLiteral("filePath")).toString() + QStringLiteral("#0");
        });
    QCOMPARE(rewritten, 2);
    for (const ss::QueueJob& job : queue.pendingJobs()) {
        if (job.filePath() == QStringLiteral("/final/a.txt")) {
            QCOMPARE(job.payload.value(QStringLiteral("derived")).toString(),
                     QStringLiteral("/final/a.txt#0"));
        } else {
            QVERIFY(!job.payload.contains(QStringLiteral("derived")));
        }
    }

    QCOMPARE(queue.removeByFilePath(QStringLiteral("/in/b.txt")), 1);
    QCOMPARE(queue.removeByFilePath(QStringLiteral("/missing")), 0);
    QCOMPARE(static_cast<int>(queue.pendingJobs().size()), 2);
}

// ── Dead letters ─────────────────────────────────────────────────

void TestStageQueue::testRetryDeadLetter()
{
    std::atomic<bool> healthy{false};
    ss::StageQueue queue(fastConfig());
    queue.setHandler([&healthy](const ss::QueueJob&) {
        return healthy.load() ? ss::JobOutcome::success()
                              : ss::JobOutcome::fail(QStringLiteral("backend down"));
    });

    const QString id = queue.enqueue(payloadFor(QStringLiteral("/a")));
    QVERIFY(queue.start());
    QTRY_COMPARE(queue.stats().failed, static_cast<size_t>(1));

    QVERIFY(!queue.retryDeadLetter(QStringLiteral("no-such-job")));

    healthy = true;
    QVERIFY(queue.retryDeadLetter(id));
    QTRY_COMPARE(queue.stats().processed, static_cast<uint64_t>(1));
    QVERIFY(queue.deadLetters().empty());
}

void TestStageQueue::testClearDeadLetters()
{
    ss::StageQueueConfig config = fastConfig();
    config.concurrency = 1;
    ss::StageQueue queue(config);
    queue.setHandler([](const ss::QueueJob&) {
        return ss::JobOutcome::fail(QStringLiteral("bad input"));
    });

    queue.enqueue(payloadFor(QStringLiteral("/a")));
    queue.enqueue(payloadFor(QStringLiteral("/b")));
    QVERIFY(queue.start());
    QTRY_COMPARE(queue.stats().failed, static_cast<size_t>(2));

    QCOMPARE(queue.clearDeadLetters(), 2);
    QCOMPARE(queue.clearDeadLetters(), 0);
    QVERIFY(queue.deadLetters().empty());
    // Lifetime counter is unaffected
    QCOMPARE(queue.stats().deadLettered, static_cast<uint64_t>(2));
}

void TestStageQueue::testDeadLetterListIsBounded()
{
    ss::StageQueueConfig config = fastConfig();
    config.concurrency = 1;
    config.maxDeadLetters = 3;
    ss::StageQueue queue(config);
    queue.setHandler([](const ss::QueueJob&) {
        return ss::JobOutcome::fail(QStringLiteral("bad input"));
    });

    for (int i = 0; i < 5; ++i) {
        queue.enqueue(payloadFor(QStringLiteral("/f%1").arg(i)));
    }
    QVERIFY(queue.start());
    QTRY_COMPARE(queue.stats().deadLettered, static_cast<uint64_t>(5));

    const std::vector<ss::QueueJob> dead = queue.deadLetters();
    QCOMPARE(static_cast<int>(dead.size()), 3);
    // Oldest entries were discarded
    QCOMPARE(dead.back().filePath(), QStringLiteral("/f4"));
}

// ── Persistence ──────────────────────────────────────────────────

void TestStageQueue::testStopPersistsPendingJobs()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());

    ss::StageQueueConfig config = fastConfig();
    config.persistDir = tempDir.path();
    {
        ss::StageQueue queue(config);
        queue.initialize();
        queue.enqueue(payloadFor(QStringLiteral("/a")));
        queue.enqueue(payloadFor(QStringLiteral("/b")));
        queue.enqueue(payloadFor(QStringLiteral("/c")));
        queue.stop();
    }

    ss::StageQueue restored(config);
    restored.initialize();
    const std::vector<ss::QueueJob> pending = restored.pendingJobs();
    QCOMPARE(static_cast<int>(pending.size()), 3);
    QCOMPARE(pending[0].filePath(), QStringLiteral("/a"));
    QCOMPARE(pending[2].filePath(), QStringLiteral("/c"));
}

void TestStageQueue::testActiveJobsRestoredAsPending()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());

    ss::QueueJob interrupted;
    interrupted.id = ss::generateJobId();
    interrupted.stage = QStringLiteral("embedding");
    interrupted.payload = payloadFor(QStringLiteral("/crashed.txt"));
    interrupted.status = ss::JobStatus::Active;
    interrupted.attempts = 1;
    interrupted.notBefore = 9999999999999LL;
    {
        ss::JsonQueuePersistence persistence(tempDir.path(), QStringLiteral("embedding"));
        QVERIFY(persistence.savePending({interrupted}));
    }

    ss::StageQueueConfig config = fastConfig();
    config.persistDir = tempDir.path();
    ss::StageQueue queue(config);
    queue.initialize();
    queue.initialize();

    const std::vector<ss::QueueJob> pending = queue.pendingJobs();
    QCOMPARE(static_cast<int>(pending.size()), 1);
    QCOMPARE(pending[0].id, interrupted.id);
    QCOMPARE(pending[0].status, ss::JobStatus::Pending);
    QCOMPARE(pending[0].notBefore, static_cast<int64_t>(0));
    QCOMPARE(pending[0].attempts, 1);

    std::atomic<int> calls{0};
    queue.setHandler([&calls](const ss::QueueJob&) {
        ++calls;
        return ss::JobOutcome::success();
    });
    QVERIFY(queue.start());
    QVERIFY(queue.waitForIdle(5000));
    QCOMPARE(calls.load(), 1);
}

void TestStageQueue::testDeadLettersSurviveRestart()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());

    ss::StageQueueConfig config = fastConfig();
    config.persistDir = tempDir.path();
    config.backend = ss::QueueBackend::Sqlite;
    {
        ss::StageQueue queue(config);
        queue.setHandler([](const ss::QueueJob&) {
            return ss::JobOutcome::fail(QStringLiteral("dimension_mismatch"));
        });
        queue.enqueue(payloadFor(QStringLiteral("/a")));
        QVERIFY(queue.start());
        QTRY_COMPARE(queue.stats().failed, static_cast<size_t>(1));
        queue.stop();
    }

    ss::StageQueue restored(config);
    restored.initialize();
    const std::vector<ss::QueueJob> dead = restored.deadLetters();
    QCOMPARE(static_cast<int>(dead.size()), 1);
    QCOMPARE(dead[0].status, ss::JobStatus::Failed);
    QCOMPARE(dead[0].lastError, QStringLiteral("dimension_mismatch"));
    QVERIFY(restored.pendingJobs().empty());
}

// ── Backoff ──────────────────────────────────────────────────────

void TestStageQueue::testInterruptedDeadLetterCheckpointKeepsJob()
{
    auto storage = std::make_shared<MemoryStorage>();
    QString jobId;
    {
        ss::StageQueue queue(fastConfig(), std::make_unique<MemoryQueuePersistence>(storage));
        queue.setHandler([](const ss::QueueJob&) {
            return ss::JobOutcome::fail(QStringLiteral("unsupported"));
        });
        jobId = queue.enqueue(payloadFor(QStringLiteral("/in/a.txt")));
        QVERIFY(queue.persist());

        // Crash after the dead-letter write, before the pending write
        storage->failPendingWrites(true);
        QVERIFY(queue.start());
        QTRY_COMPARE(static_cast<int>(queue.deadLetters().size()), 1);
        queue.stop();
    }

    const QStringList writes = storage->writeLog();
    const int deadWrite = writes.indexOf(QStringLiteral("dead"));
    QVERIFY(deadWrite > 0);
    QCOMPARE(writes.at(deadWrite + 1), QStringLiteral("pending"));
    QCOMPARE(jobIds(storage->deadLetters()), QStringList{jobId});
    QCOMPARE(jobIds(storage->pending()), QStringList{jobId});

    storage->failPendingWrites(false);
    ss::StageQueue restarted(fastConfig(), std::make_unique<MemoryQueuePersistence>(storage));
    restarted.initialize();
    QVERIFY(restarted.pendingJobs().empty());
    QCOMPARE(jobIds(restarted.deadLetters()), QStringList{jobId});
}

void TestStageQueue::testInterruptedRequeueCheckpointKeepsJob()
{
    auto storage = std::make_shared<MemoryStorage>();
    ss::QueueJob dead;
    dead.id = ss::generateJobId();
    dead.stage = QStringLiteral("embedding");
    dead.payload = payloadFor(QStringLiteral("/in/a.txt"));
    dead.attempts = 3;
    dead.status = ss::JobStatus::Failed;
    dead.lastError = QStringLiteral("timeout");
    storage->setDeadLetters({dead});

    {
        ss::StageQueue queue(fastConfig(), std::make_unique<MemoryQueuePersistence>(storage));
        queue.initialize();

        // Crash after the pending write, before the dead-letter write
        storage->failDeadLetterWrites(true);
        QVERIFY(queue.retryDeadLetter(dead.id));
        QCOMPARE(jobIds(queue.pendingJobs()), QStringList{dead.id});
    }

    const QStringList writes = storage->writeLog();
    QVERIFY(writes.size() >= 2);
    QCOMPARE(writes.at(0), QStringLiteral("pending"));
    QCOMPARE(writes.at(1), QStringLiteral("dead"));
    QCOMPARE(jobIds(storage->pending()), QStringList{dead.id});
    QCOMPARE(jobIds(storage->deadLetters()), QStringList{dead.id});

    // Restored exactly once, still dead-lettered
    storage->failDeadLetterWrites(false);
    ss::StageQueue restarted(fastConfig(), std::make_unique<MemoryQueuePersistence>(storage));
    restarted.initialize();
    QVERIFY(restarted.pendingJobs().empty());
    QCOMPARE(jobIds(restarted.deadLetters()), QStringList{dead.id});
}

void TestStageQueue::testRetryDelaySchedule()
{
    ss::StageQueueConfig config;
    config.stage = QStringLiteral("embedding");
    config.retryBaseDelayMs = 1000;
    config.retryMaxDelayMs = 30000;
    ss::StageQueue queue(config);

    QCOMPARE(queue.retryDelayMs(0), static_cast<int64_t>(0));
    QCOMPARE(queue.retryDelayMs(1), static_cast<int64_t>(1000));
    QCOMPARE(queue.retryDelayMs(2), static_cast<int64_t>(2000));
    QCOMPARE(queue.retryDelayMs(3), static_cast<int64_t>(4000));
    QCOMPARE(queue.retryDelayMs(5), static_cast<int64_t>(16000));
    QCOMPARE(queue.retryDelayMs(6), static_cast<int64_t>(30000));
    QCOMPARE(queue.retryDelayMs(40), static_cast<int64_t>(30000));
}

QTEST_MAIN(TestStageQueue)
#include "test_stage_queue.moc"
