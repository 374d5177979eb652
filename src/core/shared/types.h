#pragma once

#include <QString>

namespace ss {

// Kind of filesystem mutation recorded by the FileOperationTracker.
enum class FileOperationType {
    Move,
    Rename,
    Copy,
    Delete,
    Create,
    Unknown,
};

QString fileOperationTypeToString(FileOperationType type);
FileOperationType fileOperationTypeFromString(const QString& str);

// Lifecycle state of a QueueJob.
enum class JobStatus {
    Pending,
    Active,
    Failed,
};

QString jobStatusToString(JobStatus status);
JobStatus jobStatusFromString(const QString& str);

// Storage backend used for stage queue persistence.
enum class QueueBackend {
    JsonFiles,
    Sqlite,
};

QString queueBackendToString(QueueBackend backend);
QueueBackend queueBackendFromString(const QString& str);

} // namespace ss
