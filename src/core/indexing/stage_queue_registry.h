#pragma once

#include <QJsonObject>
#include <QString>
#include <QStringList>

#include <map>
#include <mutex>
#include <utility>
#include <vector>

namespace ss {

class StageQueue;

struct CapacityWaitResult {
    bool waited = false;          // true when the caller had to block
    double capacityPercent = 0.0; // capacity when the wait ended
};

// Non-owning view over the host's stage queues. Fans path maintenance out
// to every registered stage and exposes aggregate stats.
class StageQueueRegistry {
public:
    // Replaces any queue already registered under the same stage name.
    void registerQueue(StageQueue* queue);
    void unregisterQueue(const QString& stage);

    StageQueue* queue(const QString& stage) const;
    QStringList stages() const;

    // Each returns the total number of jobs touched across all stages.
    int updateByFilePath(const QString& oldPath, const QString& newPath,
                         const PayloadRewriter& rewrite = {});
    int updateByFilePaths(const std::vector<std::pair<QString, QString>>& pathChanges);
    int removeByFilePath(const QString& filePath);
    int removeByFilePaths(const QStringList& filePaths);

    // { "<stage>": { size, active, failed, ... }, ... }
    QJsonObject stats() const;

    // Returns false when any stage failed to checkpoint.
    bool persistAll();

    // Blocks while the stage is at or above the watermark, up to timeoutMs.
    // Unknown stages return immediately with waited == false.
    CapacityWaitResult waitForCapacity(const QString& stage,
                                       double highWatermarkPercent,
                                       int timeoutMs);

private:
    std::vector<StageQueue*> snapshot() const;

    mutable std::mutex m_mutex;
    std::map<QString, StageQueue*> m_queues;
};

} // namespace ss
