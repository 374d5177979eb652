#pragma once

#include "core/shared/clock.h"

#include <QString>

#include <condition_variable>
#include <cstdint>
#include <list>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>
#include <vector>

namespace ss {

struct EmbeddingCacheConfig {
    int maxSize = 500;
    int64_t ttlMs = 30 * 60 * 1000;
    // Period of the background purge of expired entries. 0 disables the
    // sweeper; expired entries are then only dropped on access or insert.
    int cleanupIntervalMs = 60 * 1000;
    ClockFn clock;
};

struct CachedEmbedding {
    std::vector<float> vector;
    QString model;
    int64_t createdAt = 0;
};

// EmbeddingCache -- TTL and size bounded memo of (content, model) -> vector.
//
// Entries older than ttlMs are treated as absent by every reader. Recency is
// updated on get() and set(); inserting into a full cache evicts the least
// recently used entry. All operations are serialized on one mutex.
class EmbeddingCache {
public:
    explicit EmbeddingCache(EmbeddingCacheConfig config = {});
    ~EmbeddingCache();

    EmbeddingCache(const EmbeddingCache&) = delete;
    EmbeddingCache& operator=(const EmbeddingCache&) = delete;
    EmbeddingCache(EmbeddingCache&&) = delete;
    EmbeddingCache& operator=(EmbeddingCache&&) = delete;

    // Returns a copy of the cached vector or nullopt (miss or expired).
    std::optional<CachedEmbedding> get(const QString& content, const QString& model);
    void set(const QString& content, const QString& model, const std::vector<float>& vector);
    bool contains(const QString& content, const QString& model);

    // Drops every expired entry. Returns how many were removed.
    int purgeExpired();
    void clear();

    struct Stats {
        uint64_t hits = 0;
        uint64_t misses = 0;
        uint64_t evictions = 0;
        uint64_t expirations = 0;
        int size = 0;
        int maxSize = 0;
        double hitRate = 0.0;
    };
    Stats stats() const;
    void resetStats();

    // Stops the background sweeper. Safe to call more than once.
    void shutdown();

    static QString contentKey(const QString& content);

private:
    struct Entry {
        QString key;
        CachedEmbedding value;
    };

    static QString makeKey(const QString& content, const QString& model);
    bool isExpired(const Entry& entry, int64_t now) const;
    int purgeExpiredLocked(int64_t now);
    void sweepLoop();

    EmbeddingCacheConfig m_config;
    ClockFn m_clock;

    mutable std::mutex m_mutex;
    std::list<Entry> m_list;  // front = most recently used

    struct QStringHash {
        size_t operator()(const QString& s) const { return qHash(s); }
    };
    std::unordered_map<QString, std::list<Entry>::iterator, QStringHash> m_index;

    uint64_t m_hits = 0;
    uint64_t m_misses = 0;
    uint64_t m_evictions = 0;
    uint64_t m_expirations = 0;

    std::thread m_sweeper;
    std::condition_variable m_sweepCv;
    bool m_shutdown = false;
};

} // namespace ss
