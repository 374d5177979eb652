#pragma once

#include "core/indexing/stage_queue.h"
#include "core/shared/settings.h"

#include <QJsonObject>
#include <QString>

#include <optional>

namespace ss {

// Operator actions on one persisted stage queue, as requested on the
// stratosort-queuectl command line.
struct QueueControlRequest {
    QString stage = QStringLiteral("embedding");
    QString dataDir;                       // empty = settings data dir
    std::optional<QueueBackend> backend;   // unset = settings backend
    bool listDead = false;
    QString retryJobId;                    // empty = no retry
    bool clearDead = false;
};

struct QueueControlResult {
    QJsonObject report;
    int exitCode = 0;
    QString error;
};

// Queue config from settings with the request's overrides applied.
StageQueueConfig queueControlConfig(const PipelineSettings& settings,
                                    const QueueControlRequest& request);

// Applies retry, then clear, then list, and reports queue stats before and
// after. The queue is initialized here; workers are never started.
QueueControlResult runQueueControl(StageQueue& queue, const QueueControlRequest& request);

} // namespace ss
