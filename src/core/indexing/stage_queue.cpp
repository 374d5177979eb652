#include "core/indexing/stage_queue.h"
#include "core/shared/logging.h"

#include <algorithm>
#include <chrono>
#include <exception>
#include <optional>
#include <unordered_set>

namespace ss {

namespace {

// Upper bound on a single sleep while the earliest pending job is still in
// backoff, so a clock supplied by tests is re-read regularly.
constexpr int64_t kMaxBackoffWaitMs = 50;

} // namespace

// ── Construction ────────────────────────────────────────────

StageQueue::StageQueue(StageQueueConfig config)
    : StageQueue(config,
                 config.persistDir.isEmpty()
                     ? nullptr
                     : makeQueuePersistence(config.backend, config.persistDir, config.stage))
{
}

StageQueue::StageQueue(StageQueueConfig config, std::unique_ptr<QueuePersistence> persistence)
    : m_config(std::move(config))
    , m_clock(clockOrDefault(m_config.clock))
    , m_persistence(std::move(persistence))
{
    m_config.concurrency = std::max(1, m_config.concurrency);
    m_config.maxRetries = std::max(0, m_config.maxRetries);
    m_config.retryBaseDelayMs = std::max(0, m_config.retryBaseDelayMs);
    m_config.retryMaxDelayMs = std::max(m_config.retryBaseDelayMs, m_config.retryMaxDelayMs);
    m_config.maxQueueSize = std::max(1, m_config.maxQueueSize);
    m_config.maxDeadLetters = std::max(1, m_config.maxDeadLetters);
    m_config.persistBatchSize = std::max(1, m_config.persistBatchSize);
}

StageQueue::~StageQueue()
{
    stop();
}

void StageQueue::setHandler(JobHandler handler)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_handler = std::move(handler);
}

void StageQueue::setDeadLetterCallback(DeadLetterCallback callback)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_deadLetterCallback = std::move(callback);
}

// ── Restore ─────────────────────────────────────────────────

void StageQueue::initialize()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_initialized) {
            return;
        }
    }

    std::vector<QueueJob> loadedPending;
    std::vector<QueueJob> loadedDead;
    if (m_persistence) {
        loadedPending = m_persistence->loadPending();
        loadedDead = m_persistence->loadDeadLetters();
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_initialized) {
        return;
    }
    m_initialized = true;

    // A job in both lists was interrupted between the two writes of a
    // checkpoint; the dead-letter copy wins.
    std::unordered_set<QString, QStringHash> seen;
    for (const QueueJob& job : m_pending) {
        seen.insert(job.id);
    }
    for (const QueueJob& job : loadedDead) {
        seen.insert(job.id);
    }

    std::deque<QueueJob> restored;
    int wasActive = 0;
    int duplicates = 0;
    for (QueueJob& job : loadedPending) {
        if (!seen.insert(job.id).second) {
            ++duplicates;
            continue;
        }
        if (job.stage.isEmpty()) {
            job.stage = m_config.stage;
        }
        if (job.status == JobStatus::Active) {
            ++wasActive;
            job.notBefore = 0;
        }
        job.status = JobStatus::Pending;
        restored.push_back(std::move(job));
    }
    m_pending.insert(m_pending.begin(),
                     std::make_move_iterator(restored.begin()),
                     std::make_move_iterator(restored.end()));

    std::deque<QueueJob> restoredDead;
    for (QueueJob& job : loadedDead) {
        job.status = JobStatus::Failed;
        restoredDead.push_back(std::move(job));
    }
    m_deadLetters.insert(m_deadLetters.begin(),
                         std::make_move_iterator(restoredDead.begin()),
                         std::make_move_iterator(restoredDead.end()));
    while (m_deadLetters.size() > static_cast<size_t>(m_config.maxDeadLetters)) {
        m_deadLetters.pop_front();
    }

    if (duplicates > 0) {
        LOG_WARN(ssQueue, "Stage '%s' dropped %d pending jobs already dead-lettered or restored",
                 qUtf8Printable(m_config.stage), duplicates);
    }
    if (!restored.empty() || !restoredDead.empty()) {
        LOG_INFO(ssQueue, "Stage '%s' restored %d pending (%d were active) and %d dead-lettered jobs",
                 qUtf8Printable(m_config.stage), static_cast<int>(restored.size()), wasActive,
                 static_cast<int>(restoredDead.size()));
    }
}

// ── Enqueue ─────────────────────────────────────────────────

QString StageQueue::enqueue(const QJsonObject& payload)
{
    QueueJob job;
    job.id = generateJobId();
    job.stage = m_config.stage;
    job.payload = payload;
    job.enqueuedAt = m_clock();

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_shutdown) {
            LOG_WARN(ssQueue, "Stage '%s' enqueue after stop refused", qUtf8Printable(m_config.stage));
            return {};
        }
        if (m_pending.size() + m_active.size() >= static_cast<size_t>(m_config.maxQueueSize)) {
            ++m_dropped;
            LOG_WARN(ssQueue, "Stage '%s' at capacity (%d), refused job for %s",
                     qUtf8Printable(m_config.stage), m_config.maxQueueSize,
                     qUtf8Printable(job.filePath()));
            return {};
        }
        m_pending.push_back(job);
        noteMutationLocked();
        m_workCv.notify_one();
    }

    maybePersist();
    return job.id;
}

std::vector<QString> StageQueue::enqueueBatch(const std::vector<QJsonObject>& payloads)
{
    std::vector<QString> ids;
    ids.reserve(payloads.size());
    for (const QJsonObject& payload : payloads) {
        ids.push_back(enqueue(payload));
    }
    return ids;
}

// ── Start / stop ────────────────────────────────────────────

bool StageQueue::start()
{
    initialize();

    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_running) {
        return false;
    }
    if (!m_handler) {
        LOG_ERROR(ssQueue, "Stage '%s' cannot start without a handler", qUtf8Printable(m_config.stage));
        return false;
    }

    m_running = true;
    m_stopping = false;
    m_shutdown = false;
    m_workers.reserve(static_cast<size_t>(m_config.concurrency));
    for (int i = 0; i < m_config.concurrency; ++i) {
        m_workers.emplace_back(&StageQueue::workerLoop, this);
    }

    LOG_INFO(ssQueue, "Stage '%s' started (workers=%d, pending=%d)",
             qUtf8Printable(m_config.stage), m_config.concurrency,
             static_cast<int>(m_pending.size()));
    return true;
}

void StageQueue::stop()
{
    bool wasRunning = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_shutdown = true;
        wasRunning = m_running;
        m_stopping = true;
        m_workCv.notify_all();
    }

    for (std::thread& worker : m_workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    m_workers.clear();

    bool dirty = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_running = false;
        m_stopping = false;
        dirty = m_mutationsSincePersist > 0 || m_deadLettersDirty;
    }
    m_idleCv.notify_all();

    if (dirty && !persist()) {
        LOG_ERROR(ssQueue, "Stage '%s' failed to persist on stop", qUtf8Printable(m_config.stage));
    }
    if (wasRunning) {
        LOG_INFO(ssQueue, "Stage '%s' stopped", qUtf8Printable(m_config.stage));
    }
}

// ── Pause / resume ──────────────────────────────────────────

void StageQueue::pause()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_paused) {
        m_paused = true;
        LOG_INFO(ssQueue, "Stage '%s' paused (depth=%d)",
                 qUtf8Printable(m_config.stage), static_cast<int>(m_pending.size()));
    }
}

void StageQueue::resume()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_paused) {
        m_paused = false;
        LOG_INFO(ssQueue, "Stage '%s' resumed (depth=%d)",
                 qUtf8Printable(m_config.stage), static_cast<int>(m_pending.size()));
        m_workCv.notify_all();
    }
}

bool StageQueue::isPaused() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_paused;
}

bool StageQueue::isRunning() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_running;
}

// ── Workers ─────────────────────────────────────────────────

bool StageQueue::hasReadyJobLocked(int64_t now) const
{
    return std::any_of(m_pending.begin(), m_pending.end(),
                       [now](const QueueJob& job) { return job.notBefore <= now; });
}

int64_t StageQueue::millisUntilNextReadyLocked(int64_t now) const
{
    int64_t earliest = -1;
    for (const QueueJob& job : m_pending) {
        const int64_t wait = job.notBefore - now;
        if (earliest < 0 || wait < earliest) {
            earliest = wait;
        }
    }
    return std::max<int64_t>(0, earliest);
}

void StageQueue::workerLoop()
{
    std::unique_lock<std::mutex> lock(m_mutex);
    while (!m_stopping) {
        const int64_t now = m_clock();
        if (m_paused || m_pending.empty()) {
            m_workCv.wait(lock);
            continue;
        }
        if (!hasReadyJobLocked(now)) {
            const int64_t waitMs = std::clamp<int64_t>(millisUntilNextReadyLocked(now),
                                                       1, kMaxBackoffWaitMs);
            m_workCv.wait_for(lock, std::chrono::milliseconds(waitMs));
            continue;
        }

        auto it = std::find_if(m_pending.begin(), m_pending.end(),
                               [now](const QueueJob& job) { return job.notBefore <= now; });
        QueueJob job = std::move(*it);
        m_pending.erase(it);
        job.status = JobStatus::Active;
        m_active.emplace(job.id, job);

        LOG_DEBUG(ssQueue, "Stage '%s' running job %s (attempt %d, depth=%d)",
                  qUtf8Printable(m_config.stage), qUtf8Printable(job.id), job.attempts + 1,
                  static_cast<int>(m_pending.size()));

        lock.unlock();
        const JobOutcome outcome = runHandler(job);
        finishJob(std::move(job), outcome);
        lock.lock();
    }
}

JobOutcome StageQueue::runHandler(const QueueJob& job)
{
    JobHandler handler;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        handler = m_handler;
    }
    if (!handler) {
        return JobOutcome::retry(QStringLiteral("no handler installed"));
    }
    try {
        return handler(job);
    } catch (const std::exception& e) {
        LOG_WARN(ssQueue, "Stage '%s' handler threw for job %s: %s",
                 qUtf8Printable(m_config.stage), qUtf8Printable(job.id), e.what());
        return JobOutcome::retry(QString::fromUtf8(e.what()));
    }
}

void StageQueue::finishJob(QueueJob job, const JobOutcome& outcome)
{
    std::optional<QueueJob> deadLettered;
    DeadLetterCallback callback;

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_active.erase(job.id);

        switch (outcome.kind) {
        case JobOutcome::Kind::Success:
            ++m_processed;
            break;
        case JobOutcome::Kind::Retry:
            ++job.attempts;
            job.lastError = outcome.error;
            if (job.attempts > m_config.maxRetries) {
                deadLettered = job;
                moveToDeadLetterLocked(std::move(job));
            } else {
                ++m_retried;
                job.status = JobStatus::Pending;
                job.notBefore = m_clock() + retryDelayMs(job.attempts);
                LOG_DEBUG(ssQueue, "Stage '%s' retrying job %s in %lld ms: %s",
                          qUtf8Printable(m_config.stage), qUtf8Printable(job.id),
                          static_cast<long long>(job.notBefore - m_clock()),
                          qUtf8Printable(job.lastError));
                m_pending.push_back(std::move(job));
                m_workCv.notify_one();
            }
            break;
        case JobOutcome::Kind::Fail:
            ++job.attempts;
            job.lastError = outcome.error;
            deadLettered = job;
            moveToDeadLetterLocked(std::move(job));
            break;
        }

        noteMutationLocked();
        if (deadLettered) {
            callback = m_deadLetterCallback;
        }
        if (m_pending.empty() && m_active.empty()) {
            m_idleCv.notify_all();
        }
    }

    if (deadLettered) {
        LOG_WARN(ssQueue, "Stage '%s' dead-lettered job %s after %d attempts: %s",
                 qUtf8Printable(m_config.stage), qUtf8Printable(deadLettered->id),
                 deadLettered->attempts, qUtf8Printable(deadLettered->lastError));
        if (!persist()) {
            LOG_ERROR(ssQueue, "Stage '%s' failed to persist dead letter %s",
                      qUtf8Printable(m_config.stage), qUtf8Printable(deadLettered->id));
        }
        if (callback) {
            callback(*deadLettered);
        }
        return;
    }
    maybePersist();
}

void StageQueue::moveToDeadLetterLocked(QueueJob job)
{
    job.status = JobStatus::Failed;
    job.failedAt = m_clock();
    job.notBefore = 0;
    m_deadLetters.push_back(std::move(job));
    ++m_deadLettered;
    m_deadLettersDirty = true;

    while (m_deadLetters.size() > static_cast<size_t>(m_config.maxDeadLetters)) {
        LOG_WARN(ssQueue, "Stage '%s' dead-letter list full, discarding %s",
                 qUtf8Printable(m_config.stage), qUtf8Printable(m_deadLetters.front().id));
        m_deadLetters.pop_front();
    }
}

int64_t StageQueue::retryDelayMs(int attempts) const
{
    if (attempts <= 0 || m_config.retryBaseDelayMs <= 0) {
        return 0;
    }
    const int shift = std::min(attempts - 1, 30);
    const int64_t delay = static_cast<int64_t>(m_config.retryBaseDelayMs) << shift;
    return std::min<int64_t>(delay, m_config.retryMaxDelayMs);
}

bool StageQueue::waitForIdle(int timeoutMs)
{
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_idleCv.wait_for(lock, std::chrono::milliseconds(std::max(0, timeoutMs)), [this] {
        return m_pending.empty() && m_active.empty();
    });
}

// ── Persistence ─────────────────────────────────────────────

void StageQueue::noteMutationLocked()
{
    ++m_mutationsSincePersist;
}

void StageQueue::maybePersist()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_persistence
            || (m_mutationsSincePersist < m_config.persistBatchSize && !m_deadLettersDirty)) {
            return;
        }
    }
    if (!persist()) {
        LOG_ERROR(ssQueue, "Stage '%s' checkpoint failed", qUtf8Printable(m_config.stage));
    }
}

bool StageQueue::persist()
{
    return persistSnapshot(PersistOrder::DeadLettersFirst);
}

bool StageQueue::persistSnapshot(PersistOrder order)
{
    if (!m_persistence) {
        return true;
    }
    // Merge whatever is on disk first so a snapshot never drops restored jobs.
    initialize();

    // Serializes writers so an older snapshot never lands after a newer one.
    std::lock_guard<std::mutex> persistLock(m_persistMutex);

    std::vector<QueueJob> pending;
    std::vector<QueueJob> dead;
    bool writeDead = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        pending.reserve(m_active.size() + m_pending.size());
        for (const auto& entry : m_active) {
            pending.push_back(entry.second);
        }
        pending.insert(pending.end(), m_pending.begin(), m_pending.end());
        m_mutationsSincePersist = 0;

        writeDead = m_deadLettersDirty;
        if (writeDead) {
            dead.assign(m_deadLetters.begin(), m_deadLetters.end());
            m_deadLettersDirty = false;
        }
    }

    // The second list is only written once the first one landed, so stored
    // state never has a job missing from both.
    bool pendingOk = true;
    bool deadOk = true;
    if (order == PersistOrder::PendingFirst || !writeDead) {
        pendingOk = m_persistence->savePending(pending);
        deadOk = !writeDead || (pendingOk && m_persistence->saveDeadLetters(dead));
    } else {
        deadOk = m_persistence->saveDeadLetters(dead);
        pendingOk = deadOk && m_persistence->savePending(pending);
    }

    if (pendingOk && deadOk) {
        return true;
    }
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!pendingOk) {
            m_mutationsSincePersist = std::max(1, m_mutationsSincePersist);
        }
        if (!deadOk) {
            m_deadLettersDirty = true;
        }
    }
    LOG_ERROR(ssQueue, "Stage '%s' persistence failed at %s",
              qUtf8Printable(m_config.stage), qUtf8Printable(m_persistence->location()));
    return false;
}

// ── Path maintenance ────────────────────────────────────────

int StageQueue::updateByFilePath(const QString& oldPath, const QString& newPath,
                                 const PayloadRewriter& rewrite)
{
    if (oldPath.isEmpty() || newPath.isEmpty() || oldPath == newPath) {
        return 0;
    }

    int updated = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (QueueJob& job : m_pending) {
            if (job.filePath() == oldPath) {
                job.payload.insert(QStringLiteral("filePath"), newPath);
                if (rewrite) {
                    rewrite(job.payload);
                }
                ++updated;
            }
        }
        if (updated > 0) {
            m_mutationsSincePersist += updated;
        }
    }

    if (updated > 0) {
        LOG_DEBUG(ssQueue, "Stage '%s' rewrote %d jobs: %s -> %s", qUtf8Printable(m_config.stage),
                  updated, qUtf8Printable(oldPath), qUtf8Printable(newPath));
        maybePersist();
    }
    return updated;
}

int StageQueue::removeByFilePath(const QString& filePath)
{
    if (filePath.isEmpty()) {
        return 0;
    }

    int removed = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        const auto newEnd = std::remove_if(m_pending.begin(), m_pending.end(),
                                           [&filePath](const QueueJob& job) {
                                               return job.filePath() == filePath;
                                           });
        removed = static_cast<int>(std::distance(newEnd, m_pending.end()));
        m_pending.erase(newEnd, m_pending.end());
        if (removed > 0) {
            m_mutationsSincePersist += removed;
            if (m_pending.empty() && m_active.empty()) {
                m_idleCv.notify_all();
            }
        }
    }

    if (removed > 0) {
        LOG_DEBUG(ssQueue, "Stage '%s' removed %d jobs for %s",
                  qUtf8Printable(m_config.stage), removed, qUtf8Printable(filePath));
        maybePersist();
    }
    return removed;
}

// ── Inspection ──────────────────────────────────────────────

std::vector<QueueJob> StageQueue::pendingJobs() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return std::vector<QueueJob>(m_pending.begin(), m_pending.end());
}

std::vector<QueueJob> StageQueue::deadLetters() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return std::vector<QueueJob>(m_deadLetters.begin(), m_deadLetters.end());
}

// ── Dead-letter actions ─────────────────────────────────────

bool StageQueue::retryDeadLetter(const QString& jobId)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = std::find_if(m_deadLetters.begin(), m_deadLetters.end(),
                               [&jobId](const QueueJob& job) { return job.id == jobId; });
        if (it == m_deadLetters.end()) {
            return false;
        }

        QueueJob job = std::move(*it);
        m_deadLetters.erase(it);
        job.status = JobStatus::Pending;
        job.attempts = 0;
        job.notBefore = 0;
        job.failedAt = 0;
        m_pending.push_back(std::move(job));
        m_deadLettersDirty = true;
        noteMutationLocked();
        m_workCv.notify_one();
    }

    LOG_INFO(ssQueue, "Stage '%s' requeued dead letter %s",
             qUtf8Printable(m_config.stage), qUtf8Printable(jobId));
    if (!persistSnapshot(PersistOrder::PendingFirst)) {
        LOG_ERROR(ssQueue, "Stage '%s' failed to persist requeue of %s",
                  qUtf8Printable(m_config.stage), qUtf8Printable(jobId));
    }
    return true;
}

int StageQueue::retryAllDeadLetters()
{
    std::vector<QString> ids;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const QueueJob& job : m_deadLetters) {
            ids.push_back(job.id);
        }
    }

    int requeued = 0;
    for (const QString& id : ids) {
        if (retryDeadLetter(id)) {
            ++requeued;
        }
    }
    return requeued;
}

int StageQueue::clearDeadLetters()
{
    int cleared = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        cleared = static_cast<int>(m_deadLetters.size());
        if (cleared == 0) {
            return 0;
        }
        m_deadLetters.clear();
        m_deadLettersDirty = true;
    }

    LOG_INFO(ssQueue, "Stage '%s' cleared %d dead letters", qUtf8Printable(m_config.stage), cleared);
    if (!persist()) {
        LOG_ERROR(ssQueue, "Stage '%s' failed to persist cleared dead letters",
                  qUtf8Printable(m_config.stage));
    }
    return cleared;
}

StageQueueStats StageQueue::stats() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    StageQueueStats s;
    s.stage = m_config.stage;
    s.size = m_pending.size();
    s.active = m_active.size();
    s.failed = m_deadLetters.size();
    s.processed = m_processed;
    s.retried = m_retried;
    s.deadLettered = m_deadLettered;
    s.dropped = m_dropped;
    s.paused = m_paused;
    s.running = m_running;
    s.capacityPercent = 100.0 * static_cast<double>(m_pending.size() + m_active.size())
                        / static_cast<double>(m_config.maxQueueSize);
    return s;
}

} // namespace ss
