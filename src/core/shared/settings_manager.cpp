#include "core/shared/settings_manager.h"
#include "core/shared/atomic_json_file.h"
#include "core/shared/logging.h"

#include <QJsonDocument>
#include <QStandardPaths>

#include <algorithm>

namespace ss {

namespace {

int readInt(const QJsonObject& json, const char* key, int fallback, int minValue, int maxValue)
{
    const QString k = QString::fromLatin1(key);
    if (!json.contains(k)) {
        return fallback;
    }
    return std::clamp(json.value(k).toInt(fallback), minValue, maxValue);
}

int64_t readInt64(const QJsonObject& json, const char* key, int64_t fallback, int64_t minValue)
{
    const QString k = QString::fromLatin1(key);
    if (!json.contains(k)) {
        return fallback;
    }
    const int64_t value = json.value(k).toVariant().toLongLong();
    return std::max(value, minValue);
}

} // namespace

std::optional<PipelineSettings> SettingsManager::load()
{
    return load(settingsFilePath());
}

std::optional<PipelineSettings> SettingsManager::load(const QString& filePath)
{
    const std::optional<QJsonDocument> doc =
        atomic_json::load(filePath, QStringLiteral("pipeline settings"));
    if (!doc) {
        return std::nullopt;
    }
    if (!doc->isObject()) {
        LOG_WARN(ssCore, "Settings file is not a JSON object: %s", qUtf8Printable(filePath));
        return std::nullopt;
    }
    return fromJson(doc->object());
}

bool SettingsManager::save(const PipelineSettings& settings)
{
    return save(settings, settingsFilePath());
}

bool SettingsManager::save(const PipelineSettings& settings, const QString& filePath)
{
    if (!atomic_json::write(filePath, QJsonDocument(toJson(settings)), true)) {
        LOG_ERROR(ssCore, "Failed to save settings: %s", qUtf8Printable(filePath));
        return false;
    }
    return true;
}

QString SettingsManager::settingsFilePath()
{
    return defaultDataDir() + QStringLiteral("/pipeline-settings.json");
}

QString SettingsManager::defaultDataDir()
{
    const QString basePath = QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation);
    return basePath + QStringLiteral("/stratosort");
}

QString SettingsManager::resolveDataDir(const PipelineSettings& settings)
{
    return settings.dataDir.isEmpty() ? defaultDataDir() : settings.dataDir;
}

QJsonObject SettingsManager::toJson(const PipelineSettings& settings)
{
    QJsonObject json;
    json.insert(QStringLiteral("dataDir"), settings.dataDir);
    json.insert(QStringLiteral("embeddingModel"), settings.embeddingModel);
    json.insert(QStringLiteral("generationModel"), settings.generationModel);
    json.insert(QStringLiteral("expectedDimensions"), settings.expectedDimensions);
    json.insert(QStringLiteral("embeddingContextTokens"), settings.embeddingContextTokens);
    json.insert(QStringLiteral("charsPerToken"), settings.charsPerToken);
    json.insert(QStringLiteral("chunkSize"), settings.chunkSize);
    json.insert(QStringLiteral("chunkOverlap"), settings.chunkOverlap);
    json.insert(QStringLiteral("maxChunks"), settings.maxChunks);
    json.insert(QStringLiteral("cacheMaxSize"), settings.cacheMaxSize);
    json.insert(QStringLiteral("cacheTtlMs"), static_cast<qint64>(settings.cacheTtlMs));
    json.insert(QStringLiteral("cacheCleanupIntervalMs"), settings.cacheCleanupIntervalMs);
    json.insert(QStringLiteral("queueConcurrency"), settings.queueConcurrency);
    json.insert(QStringLiteral("queueMaxRetries"), settings.queueMaxRetries);
    json.insert(QStringLiteral("retryBaseDelayMs"), settings.retryBaseDelayMs);
    json.insert(QStringLiteral("retryMaxDelayMs"), settings.retryMaxDelayMs);
    json.insert(QStringLiteral("queueMaxSize"), settings.queueMaxSize);
    json.insert(QStringLiteral("persistBatchSize"), settings.persistBatchSize);
    json.insert(QStringLiteral("queueBackend"), queueBackendToString(settings.queueBackend));
    json.insert(QStringLiteral("lockPollIntervalMs"), settings.lockPollIntervalMs);
    json.insert(QStringLiteral("lockTimeoutMs"), settings.lockTimeoutMs);
    json.insert(QStringLiteral("staleLockMs"), static_cast<qint64>(settings.staleLockMs));
    json.insert(QStringLiteral("trackerCooldownMs"), static_cast<qint64>(settings.trackerCooldownMs));
    json.insert(QStringLiteral("caseInsensitivePaths"), settings.caseInsensitivePaths);
    json.insert(QStringLiteral("trackerMaxRecords"), settings.trackerMaxRecords);
    return json;
}

PipelineSettings SettingsManager::fromJson(const QJsonObject& json)
{
    PipelineSettings s;

    s.dataDir = json.value(QStringLiteral("dataDir")).toString(s.dataDir);
    s.embeddingModel = json.value(QStringLiteral("embeddingModel")).toString(s.embeddingModel);
    s.generationModel = json.value(QStringLiteral("generationModel")).toString(s.generationModel);
    s.expectedDimensions = readInt(json, "expectedDimensions", s.expectedDimensions, 0, 65536);

    s.embeddingContextTokens = readInt(json, "embeddingContextTokens",
                                       s.embeddingContextTokens, 1, 1 << 20);
    const double charsPerToken = json.value(QStringLiteral("charsPerToken")).toDouble(s.charsPerToken);
    if (charsPerToken > 0.0) {
        s.charsPerToken = charsPerToken;
    }

    s.chunkSize = readInt(json, "chunkSize", s.chunkSize, 1, 1 << 24);
    s.chunkOverlap = readInt(json, "chunkOverlap", s.chunkOverlap, 0, s.chunkSize - 1);
    s.maxChunks = readInt(json, "maxChunks", s.maxChunks, 1, 1 << 20);

    s.cacheMaxSize = readInt(json, "cacheMaxSize", s.cacheMaxSize, 1, 1 << 24);
    s.cacheTtlMs = readInt64(json, "cacheTtlMs", s.cacheTtlMs, 1);
    s.cacheCleanupIntervalMs = readInt(json, "cacheCleanupIntervalMs",
                                       s.cacheCleanupIntervalMs, 0, 24 * 60 * 60 * 1000);

    s.queueConcurrency = readInt(json, "queueConcurrency", s.queueConcurrency, 1, 64);
    s.queueMaxRetries = readInt(json, "queueMaxRetries", s.queueMaxRetries, 0, 100);
    s.retryBaseDelayMs = readInt(json, "retryBaseDelayMs", s.retryBaseDelayMs, 0, 60 * 60 * 1000);
    s.retryMaxDelayMs = readInt(json, "retryMaxDelayMs", s.retryMaxDelayMs,
                                s.retryBaseDelayMs, 24 * 60 * 60 * 1000);
    s.queueMaxSize = readInt(json, "queueMaxSize", s.queueMaxSize, 1, 1 << 24);
    s.persistBatchSize = readInt(json, "persistBatchSize", s.persistBatchSize, 1, 1 << 16);
    if (json.contains(QStringLiteral("queueBackend"))) {
        s.queueBackend = queueBackendFromString(json.value(QStringLiteral("queueBackend")).toString());
    }

    s.lockPollIntervalMs = readInt(json, "lockPollIntervalMs", s.lockPollIntervalMs, 1, 60 * 1000);
    s.lockTimeoutMs = readInt(json, "lockTimeoutMs", s.lockTimeoutMs, 0, 24 * 60 * 60 * 1000);
    s.staleLockMs = readInt64(json, "staleLockMs", s.staleLockMs, 1);

    s.trackerCooldownMs = readInt64(json, "trackerCooldownMs", s.trackerCooldownMs, 1);
    s.caseInsensitivePaths = json.value(QStringLiteral("caseInsensitivePaths"))
                                 .toBool(s.caseInsensitivePaths);
    s.trackerMaxRecords = readInt(json, "trackerMaxRecords", s.trackerMaxRecords, 1, 1 << 24);

    return s;
}

} // namespace ss
