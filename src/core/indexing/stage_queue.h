#pragma once

#include "core/indexing/queue_job.h"
#include "core/indexing/queue_persistence.h"
#include "core/shared/clock.h"
#include "core/shared/types.h"

#include <QJsonObject>
#include <QString>

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

namespace ss {

struct StageQueueConfig {
    QString stage;
    // Directory for persisted state. Empty keeps the queue in memory only.
    QString persistDir;
    QueueBackend backend = QueueBackend::JsonFiles;

    int concurrency = 2;
    int maxRetries = 3;              // retries after the first attempt
    int retryBaseDelayMs = 1000;
    int retryMaxDelayMs = 30000;
    int maxQueueSize = 10000;
    int maxDeadLetters = 1000;
    int persistBatchSize = 10;       // mutations between checkpoints
    ClockFn clock;
};

// Result of running one job through the stage handler.
struct JobOutcome {
    enum class Kind {
        Success,
        Retry,   // transient failure, counts against the retry budget
        Fail,    // permanent failure, dead-lettered without retrying
    };

    Kind kind = Kind::Success;
    QString error;

    static JobOutcome success() { return {}; }
    static JobOutcome retry(const QString& error) { return {Kind::Retry, error}; }
    static JobOutcome fail(const QString& error) { return {Kind::Fail, error}; }
};

using JobHandler = std::function<JobOutcome(const QueueJob&)>;
using DeadLetterCallback = std::function<void(const QueueJob&)>;
// Applied to a payload after its "filePath" has been set to the new path.
using PayloadRewriter = std::function<void(QJsonObject& payload)>;

struct StageQueueStats {
    QString stage;
    size_t size = 0;             // pending jobs, including ones waiting on backoff
    size_t active = 0;
    size_t failed = 0;           // dead letters
    uint64_t processed = 0;
    uint64_t retried = 0;
    uint64_t deadLettered = 0;
    uint64_t dropped = 0;
    bool paused = false;
    bool running = false;
    double capacityPercent = 0.0;
};

// StageQueue: durable, retrying job queue for one pipeline stage.
//
// Jobs are taken oldest-first among those whose backoff has elapsed and run
// on a pool of `concurrency` worker threads. A job that keeps failing moves
// to the dead-letter list once `attempts > maxRetries` and is never retried
// automatically. Pending and dead-lettered jobs are checkpointed to the
// configured QueuePersistence; jobs that were active at a crash are restored
// as pending on the next initialize(). The two lists are written in the order
// that turns an interrupted checkpoint into a duplicate rather than a lost
// job, and initialize() keeps the dead-letter copy of a duplicate.
//
// Completion order is not guaranteed to match enqueue order.
class StageQueue {
public:
    explicit StageQueue(StageQueueConfig config);
    StageQueue(StageQueueConfig config, std::unique_ptr<QueuePersistence> persistence);
    ~StageQueue();

    // Non-copyable, non-movable (owns worker threads)
    StageQueue(const StageQueue&) = delete;
    StageQueue& operator=(const StageQueue&) = delete;
    StageQueue(StageQueue&&) = delete;
    StageQueue& operator=(StageQueue&&) = delete;

    const QString& stage() const { return m_config.stage; }
    const StageQueueConfig& config() const { return m_config; }

    // Must be set before start().
    void setHandler(JobHandler handler);
    void setDeadLetterCallback(DeadLetterCallback callback);

    // Load persisted jobs. Idempotent; unreadable state starts empty.
    void initialize();

    // Append a pending job. Returns the job id, or an empty string when the
    // queue has been stopped or holds maxQueueSize jobs.
    QString enqueue(const QJsonObject& payload);
    std::vector<QString> enqueueBatch(const std::vector<QJsonObject>& payloads);

    // Start the worker pool. Returns false without a handler or when running.
    bool start();

    // Stop workers after in-flight jobs finish, then checkpoint unsaved
    // changes. Must not be called from a job handler.
    void stop();

    void pause();
    void resume();
    bool isPaused() const;
    bool isRunning() const;

    // Checkpoint now. Returns false when any write failed.
    bool persist();

    // Blocks until no job is pending or active, or the timeout elapses.
    bool waitForIdle(int timeoutMs);

    // Rewrite or drop pending jobs whose payload "filePath" matches. The
    // rewriter, when given, updates fields derived from the path.
    int updateByFilePath(const QString& oldPath, const QString& newPath,
                         const PayloadRewriter& rewrite = {});
    int removeByFilePath(const QString& filePath);

    std::vector<QueueJob> pendingJobs() const;
    std::vector<QueueJob> deadLetters() const;

    // Operator actions: move dead letters back to pending with a fresh
    // retry budget, or discard them.
    bool retryDeadLetter(const QString& jobId);
    int retryAllDeadLetters();
    int clearDeadLetters();

    StageQueueStats stats() const;

    // Backoff before the next attempt after `attempts` failures.
    int64_t retryDelayMs(int attempts) const;

private:
    // Which list reaches storage first when both changed.
    enum class PersistOrder {
        DeadLettersFirst,   // a job moved into the dead-letter list
        PendingFirst,       // a job moved out of it
    };

    bool persistSnapshot(PersistOrder order);
    void workerLoop();
    bool hasReadyJobLocked(int64_t now) const;
    int64_t millisUntilNextReadyLocked(int64_t now) const;
    void finishJob(QueueJob job, const JobOutcome& outcome);
    JobOutcome runHandler(const QueueJob& job);
    void moveToDeadLetterLocked(QueueJob job);
    void noteMutationLocked();
    void maybePersist();

    StageQueueConfig m_config;
    ClockFn m_clock;
    std::unique_ptr<QueuePersistence> m_persistence;
    JobHandler m_handler;
    DeadLetterCallback m_deadLetterCallback;

    struct QStringHash {
        size_t operator()(const QString& s) const { return qHash(s); }
    };

    mutable std::mutex m_mutex;
    std::condition_variable m_workCv;
    std::condition_variable m_idleCv;

    std::deque<QueueJob> m_pending;
    std::unordered_map<QString, QueueJob, QStringHash> m_active;
    std::deque<QueueJob> m_deadLetters;

    std::vector<std::thread> m_workers;
    bool m_running = false;
    bool m_stopping = false;
    bool m_paused = false;
    bool m_initialized = false;
    bool m_shutdown = false;

    int m_mutationsSincePersist = 0;
    bool m_deadLettersDirty = false;
    std::mutex m_persistMutex;

    uint64_t m_processed = 0;
    uint64_t m_retried = 0;
    uint64_t m_deadLettered = 0;
    uint64_t m_dropped = 0;
};

} // namespace ss
