#pragma once

#include "core/shared/types.h"

#include <QJsonObject>
#include <QString>

#include <cstdint>
#include <optional>

namespace ss {

// One unit of work owned by a StageQueue for its whole lifecycle.
struct QueueJob {
    QString id;
    QString stage;
    QJsonObject payload;
    int attempts = 0;
    JobStatus status = JobStatus::Pending;
    int64_t enqueuedAt = 0;      // epoch ms
    int64_t notBefore = 0;       // earliest retry time, epoch ms
    int64_t failedAt = 0;        // set when dead-lettered
    QString lastError;

    // Convenience accessor for the payload's "filePath" field.
    QString filePath() const;
};

QJsonObject queueJobToJson(const QueueJob& job);
// Returns nullopt for records without an id.
std::optional<QueueJob> queueJobFromJson(const QJsonObject& json);

QString generateJobId();

} // namespace ss
