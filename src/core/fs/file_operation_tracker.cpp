#include "core/fs/file_operation_tracker.h"
#include "core/fs/path_normalizer.h"
#include "core/shared/atomic_json_file.h"
#include "core/shared/logging.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

#include <algorithm>
#include <vector>

namespace ss {

FileOperationTracker::FileOperationTracker(FileOperationTrackerConfig config)
    : m_config(std::move(config))
    , m_clock(clockOrDefault(m_config.clock))
{
    m_config.cooldownMs = std::max<int64_t>(1, m_config.cooldownMs);
    m_config.maxRecords = std::max(1, m_config.maxRecords);
}

FileOperationTracker::~FileOperationTracker()
{
    shutdown();
}

QString FileOperationTracker::normalize(const QString& path) const
{
    return normalizeOperationPath(path, m_config.caseInsensitivePaths);
}

bool FileOperationTracker::isExpired(const OperationRecord& record, int64_t now) const
{
    return now - record.timestamp >= m_config.cooldownMs;
}

// ── Lifecycle ───────────────────────────────────────────────

int FileOperationTracker::initialize()
{
    if (m_config.persistencePath.isEmpty()) {
        return 0;
    }

    const std::optional<QJsonDocument> doc =
        atomic_json::load(m_config.persistencePath, QStringLiteral("file operation records"));
    if (!doc) {
        return 0;
    }
    if (!doc->isArray()) {
        LOG_WARN(ssFs, "File operation records are not a JSON array: %s",
                 qUtf8Printable(m_config.persistencePath));
        return 0;
    }

    const int64_t now = m_clock();
    int restored = 0;
    int expired = 0;

    std::lock_guard<std::mutex> lock(m_mutex);
    for (const QJsonValue& value : doc->array()) {
        const QJsonObject obj = value.toObject();
        OperationRecord record;
        record.path = normalize(obj.value(QStringLiteral("path")).toString());
        record.timestamp = obj.value(QStringLiteral("timestamp")).toVariant().toLongLong();
        record.operationType =
            fileOperationTypeFromString(obj.value(QStringLiteral("operationType")).toString());
        record.source = obj.value(QStringLiteral("source")).toString();
        if (record.path.isEmpty()) {
            continue;
        }
        if (isExpired(record, now)) {
            ++expired;
            continue;
        }

        // Records made since startup win over persisted ones.
        const auto existing = m_records.find(record.path);
        if (existing != m_records.end() && existing->second.timestamp >= record.timestamp) {
            continue;
        }
        m_records[record.path] = std::move(record);
        ++restored;
    }
    while (m_records.size() > static_cast<size_t>(m_config.maxRecords)) {
        evictOldestLocked();
    }

    LOG_INFO(ssFs, "Restored %d file operation records (%d expired)", restored, expired);
    return restored;
}

void FileOperationTracker::shutdown()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_shutdown) {
            return;
        }
        m_shutdown = true;
    }
    if (!m_config.persistencePath.isEmpty() && !persist()) {
        LOG_ERROR(ssFs, "Failed to persist file operation records: %s",
                  qUtf8Printable(m_config.persistencePath));
    }
}

bool FileOperationTracker::persist()
{
    QJsonArray array;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        const int64_t now = m_clock();
        for (const auto& entry : m_records) {
            const OperationRecord& record = entry.second;
            if (isExpired(record, now)) {
                continue;
            }
            QJsonObject obj;
            obj[QStringLiteral("path")] = record.path;
            obj[QStringLiteral("timestamp")] = static_cast<qint64>(record.timestamp);
            obj[QStringLiteral("operationType")] = fileOperationTypeToString(record.operationType);
            obj[QStringLiteral("source")] = record.source;
            array.append(obj);
        }
    }
    return atomic_json::write(m_config.persistencePath, QJsonDocument(array));
}

// ── Recording ───────────────────────────────────────────────

void FileOperationTracker::recordOperation(const QString& path,
                                           FileOperationType operationType,
                                           const QString& source)
{
    const QString key = normalize(path);
    if (key.isEmpty()) {
        return;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    OperationRecord& record = m_records[key];
    record.path = key;
    record.operationType = operationType;
    record.source = source;
    record.timestamp = m_clock();

    while (m_records.size() > static_cast<size_t>(m_config.maxRecords)) {
        evictOldestLocked();
    }
    LOG_DEBUG(ssFs, "Recorded %s of %s by %s", qUtf8Printable(fileOperationTypeToString(operationType)),
              qUtf8Printable(key), qUtf8Printable(source));
}

void FileOperationTracker::evictOldestLocked()
{
    const auto oldest = std::min_element(m_records.begin(), m_records.end(),
                                         [](const auto& a, const auto& b) {
                                             return a.second.timestamp < b.second.timestamp;
                                         });
    if (oldest != m_records.end()) {
        m_records.erase(oldest);
    }
}

// ── Queries ─────────────────────────────────────────────────

bool FileOperationTracker::wasRecentlyOperated(const QString& path, const QString& excludeSource)
{
    const std::optional<OperationRecord> record = lastOperation(path);
    if (!record) {
        return false;
    }
    return excludeSource.isEmpty() || record->source != excludeSource;
}

std::optional<OperationRecord> FileOperationTracker::lastOperation(const QString& path)
{
    const QString key = normalize(path);
    if (key.isEmpty()) {
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    const auto it = m_records.find(key);
    if (it == m_records.end()) {
        return std::nullopt;
    }
    if (isExpired(it->second, m_clock())) {
        m_records.erase(it);
        return std::nullopt;
    }
    return it->second;
}

bool FileOperationTracker::clearPath(const QString& path)
{
    const QString key = normalize(path);
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_records.erase(key) > 0;
}

int FileOperationTracker::purgeExpired()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const int64_t now = m_clock();
    int purged = 0;
    for (auto it = m_records.begin(); it != m_records.end();) {
        if (isExpired(it->second, now)) {
            it = m_records.erase(it);
            ++purged;
        } else {
            ++it;
        }
    }
    return purged;
}

size_t FileOperationTracker::size() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_records.size();
}

} // namespace ss
