#include "core/embedding/embedding_cache.h"
#include "core/shared/logging.h"

#include <QCryptographicHash>

#include <algorithm>
#include <chrono>
#include <utility>

namespace ss {

EmbeddingCache::EmbeddingCache(EmbeddingCacheConfig config)
    : m_config(std::move(config))
    , m_clock(clockOrDefault(m_config.clock))
{
    m_config.maxSize = std::max(m_config.maxSize, 1);
    if (m_config.cleanupIntervalMs > 0) {
        m_sweeper = std::thread([this]() { sweepLoop(); });
    }
}

EmbeddingCache::~EmbeddingCache()
{
    shutdown();
}

QString EmbeddingCache::contentKey(const QString& content)
{
    const QByteArray hash = QCryptographicHash::hash(content.toUtf8(), QCryptographicHash::Sha256);
    return QString::fromLatin1(hash.toHex());
}

QString EmbeddingCache::makeKey(const QString& content, const QString& model)
{
    return model + QLatin1Char('|') + contentKey(content);
}

bool EmbeddingCache::isExpired(const Entry& entry, int64_t now) const
{
    return now - entry.value.createdAt >= m_config.ttlMs;
}

std::optional<CachedEmbedding> EmbeddingCache::get(const QString& content, const QString& model)
{
    const QString key = makeKey(content, model);
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_index.find(key);
    if (it == m_index.end()) {
        ++m_misses;
        return std::nullopt;
    }

    if (isExpired(*it->second, m_clock())) {
        // Expired, remove lazily
        m_list.erase(it->second);
        m_index.erase(it);
        ++m_expirations;
        ++m_misses;
        return std::nullopt;
    }

    // Move to front (most recently used)
    if (it->second != m_list.begin()) {
        m_list.splice(m_list.begin(), m_list, it->second);
    }

    ++m_hits;
    return it->second->value;
}

bool EmbeddingCache::contains(const QString& content, const QString& model)
{
    const QString key = makeKey(content, model);
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_index.find(key);
    return it != m_index.end() && !isExpired(*it->second, m_clock());
}

void EmbeddingCache::set(const QString& content, const QString& model,
                         const std::vector<float>& vector)
{
    const QString key = makeKey(content, model);
    std::lock_guard<std::mutex> lock(m_mutex);
    const int64_t now = m_clock();

    // If key already exists, replace it (resets creation time)
    auto existing = m_index.find(key);
    if (existing != m_index.end()) {
        m_list.erase(existing->second);
        m_index.erase(existing);
    }

    // Prefer dropping expired entries over evicting live ones
    if (static_cast<int>(m_list.size()) >= m_config.maxSize) {
        purgeExpiredLocked(now);
    }

    // Evict least recently used entries if at capacity
    while (static_cast<int>(m_list.size()) >= m_config.maxSize && !m_list.empty()) {
        const auto& back = m_list.back();
        m_index.erase(back.key);
        m_list.pop_back();
        ++m_evictions;
    }

    m_list.push_front({key, CachedEmbedding{vector, model, now}});
    m_index[key] = m_list.begin();
}

int EmbeddingCache::purgeExpired()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return purgeExpiredLocked(m_clock());
}

int EmbeddingCache::purgeExpiredLocked(int64_t now)
{
    int removed = 0;
    for (auto it = m_list.begin(); it != m_list.end();) {
        if (isExpired(*it, now)) {
            m_index.erase(it->key);
            it = m_list.erase(it);
            ++m_expirations;
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

void EmbeddingCache::clear()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_list.clear();
    m_index.clear();
}

EmbeddingCache::Stats EmbeddingCache::stats() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    Stats s;
    s.hits = m_hits;
    s.misses = m_misses;
    s.evictions = m_evictions;
    s.expirations = m_expirations;
    s.size = static_cast<int>(m_list.size());
    s.maxSize = m_config.maxSize;
    const uint64_t lookups = m_hits + m_misses;
    s.hitRate = lookups > 0 ? static_cast<double>(m_hits) / static_cast<double>(lookups) : 0.0;
    return s;
}

void EmbeddingCache::resetStats()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_hits = 0;
    m_misses = 0;
    m_evictions = 0;
    m_expirations = 0;
}

void EmbeddingCache::shutdown()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_shutdown) {
            return;
        }
        m_shutdown = true;
    }
    m_sweepCv.notify_all();
    if (m_sweeper.joinable()) {
        m_sweeper.join();
    }
}

void EmbeddingCache::sweepLoop()
{
    std::unique_lock<std::mutex> lock(m_mutex);
    while (!m_shutdown) {
        m_sweepCv.wait_for(lock, std::chrono::milliseconds(m_config.cleanupIntervalMs),
                           [this] { return m_shutdown; });
        if (m_shutdown) {
            break;
        }
        const int removed = purgeExpiredLocked(m_clock());
        if (removed > 0) {
            LOG_DEBUG(ssEmbed, "EmbeddingCache purged %d expired entries (size=%d)",
                      removed, static_cast<int>(m_list.size()));
        }
    }
}

} // namespace ss
