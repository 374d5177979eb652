#pragma once

#include "core/shared/clock.h"
#include "core/shared/types.h"

#include <QString>

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace ss {

struct FileOperationTrackerConfig {
    int64_t cooldownMs = 5000;
    // JSON file for records that survive a restart. Empty disables persistence.
    QString persistencePath;
    bool caseInsensitivePaths = true;
    int maxRecords = 10000;
    ClockFn clock;
};

struct OperationRecord {
    QString path;                // normalized
    FileOperationType operationType = FileOperationType::Unknown;
    QString source;              // e.g. "organizer", "watcher", "undo"
    int64_t timestamp = 0;       // epoch ms
};

// FileOperationTracker: remembers files the app itself just touched so the
// filesystem watcher can ignore the echo of its own moves.
//
// A record lives while `now - timestamp < cooldownMs`; expired records are
// invisible and are dropped lazily. Paths are normalized before use, so
// "C:\\Docs\\a.txt" and "c:/docs/a.txt" refer to the same record when
// caseInsensitivePaths is set.
class FileOperationTracker {
public:
    explicit FileOperationTracker(FileOperationTrackerConfig config = {});
    ~FileOperationTracker();

    FileOperationTracker(const FileOperationTracker&) = delete;
    FileOperationTracker& operator=(const FileOperationTracker&) = delete;

    // Load persisted records, discarding expired ones. Missing or corrupt
    // files start empty. Returns the number of records restored.
    int initialize();

    // Persist un-expired records. Idempotent; also called by the destructor.
    void shutdown();

    void recordOperation(const QString& path,
                         FileOperationType operationType,
                         const QString& source);

    // True when the path has an un-expired record whose source differs from
    // excludeSource (an empty excludeSource matches every source).
    bool wasRecentlyOperated(const QString& path, const QString& excludeSource = QString());

    std::optional<OperationRecord> lastOperation(const QString& path);
    bool clearPath(const QString& path);
    int purgeExpired();
    size_t size() const;

    const FileOperationTrackerConfig& config() const { return m_config; }

private:
    QString normalize(const QString& path) const;
    bool isExpired(const OperationRecord& record, int64_t now) const;
    void evictOldestLocked();
    bool persist();

    struct QStringHash {
        size_t operator()(const QString& s) const { return qHash(s); }
    };

    FileOperationTrackerConfig m_config;
    ClockFn m_clock;

    mutable std::mutex m_mutex;
    std::unordered_map<QString, OperationRecord, QStringHash> m_records;
    bool m_shutdown = false;
};

} // namespace ss
