#pragma once

#include "core/shared/clock.h"

#include <QJsonObject>
#include <QString>

#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace ss {

struct BatchLockConfig {
    int pollIntervalMs = 100;
    int64_t staleLockMs = 5 * 60 * 1000;
    ClockFn clock;
};

struct BatchLockStats {
    uint64_t acquisitions = 0;
    uint64_t releases = 0;
    uint64_t timeouts = 0;
    uint64_t staleReclaims = 0;
    uint64_t rejectedReleases = 0;
};

// BatchLockManager: single global token serializing whole-batch file
// operations (organize runs, undo/redo batches).
//
// State machine:
//   Free --acquire--> Held --release--> Free
//                     Held --older than staleLockMs--> Free (reclaimed on the
//                                                      next acquisition attempt)
//
// A holder that re-acquires while already holding succeeds immediately and
// keeps its original acquisition time. Only the holder can release.
class BatchLockManager {
public:
    enum class State {
        Free,
        Held,
    };

    enum class AcquireResult {
        Acquired,      // taken by this call
        AlreadyHeld,   // the holder already owned it
        Unavailable,   // held by someone else past the timeout, or bad holder id
    };

    explicit BatchLockManager(BatchLockConfig config = {});

    BatchLockManager(const BatchLockManager&) = delete;
    BatchLockManager& operator=(const BatchLockManager&) = delete;

    // Non-blocking attempt.
    bool tryAcquire(const QString& holderId);

    // Polls every pollIntervalMs (woken early by release) until acquired or
    // timeoutMs elapses. Returns false on timeout.
    bool acquire(const QString& holderId, int timeoutMs);

    // Same wait as acquire(), reporting whether this call took the lock.
    AcquireResult acquireFor(const QString& holderId, int timeoutMs);

    // Waits as long as it takes. Stale reclamation still applies.
    void acquireUnbounded(const QString& holderId);

    // Returns false (and changes nothing) when holderId is not the holder.
    bool release(const QString& holderId);

    State state() const;
    QString currentHolder() const;   // empty when free
    int64_t heldForMs() const;       // 0 when free
    BatchLockStats stats() const;
    QJsonObject statsJson() const;

private:
    AcquireResult tryAcquireLocked(const QString& holderId);
    void reclaimIfStaleLocked(int64_t now);

    BatchLockConfig m_config;
    ClockFn m_clock;

    mutable std::mutex m_mutex;
    std::condition_variable m_releasedCv;

    State m_state = State::Free;
    QString m_holderId;
    int64_t m_acquiredAt = 0;
    BatchLockStats m_stats;
};

// Releases the lock on scope exit only when the guard itself took it. A
// guard opened by the current holder leaves the outer hold in place.
class BatchLockGuard {
public:
    BatchLockGuard(BatchLockManager& manager, const QString& holderId, int timeoutMs);
    ~BatchLockGuard();

    BatchLockGuard(const BatchLockGuard&) = delete;
    BatchLockGuard& operator=(const BatchLockGuard&) = delete;

    // True when the holder has the lock, whether or not this guard took it.
    bool holds() const { return m_result != BatchLockManager::AcquireResult::Unavailable; }
    // True when this guard took the lock and will release it.
    bool owns() const { return m_result == BatchLockManager::AcquireResult::Acquired; }

private:
    BatchLockManager& m_manager;
    QString m_holderId;
    BatchLockManager::AcquireResult m_result;
};

} // namespace ss
