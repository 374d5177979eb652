#pragma once

#include "core/embedding/embedding_cache.h"
#include "core/fs/batch_lock_manager.h"
#include "core/fs/file_operation_tracker.h"
#include "core/indexing/chunker.h"
#include "core/indexing/stage_queue.h"
#include "core/shared/settings.h"

#include <QString>

namespace ss {

// Component configs derived from PipelineSettings. Paths are resolved against
// SettingsManager::resolveDataDir(settings); clocks are left unset so each
// component falls back to the system clock.

StageQueueConfig stageQueueConfigFrom(const PipelineSettings& settings, const QString& stage);
EmbeddingCacheConfig embeddingCacheConfigFrom(const PipelineSettings& settings);
BatchLockConfig batchLockConfigFrom(const PipelineSettings& settings);
FileOperationTrackerConfig trackerConfigFrom(const PipelineSettings& settings);
ChunkerConfig chunkerConfigFrom(const PipelineSettings& settings);

// <dataDir>/file-operations.json
QString trackerFilePath(const PipelineSettings& settings);

} // namespace ss
