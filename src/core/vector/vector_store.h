#pragma once

#include <QJsonObject>
#include <QString>

#include <cstdint>
#include <vector>

namespace ss {

struct VectorMatch {
    QString id;
    double score = 0.0;          // higher is more similar
    QJsonObject metadata;
};

struct VectorStoreStats {
    int64_t count = 0;
    int dimensions = 0;
};

// On-disk vector index consumed by the pipeline. Its search algorithm is
// owned by the implementation; the pipeline only feeds and queries it.
class VectorStore {
public:
    virtual ~VectorStore() = default;

    // Insert or replace the vector stored under `id`. Returns false on failure.
    virtual bool put(const QString& id, const std::vector<float>& vector,
                     const QJsonObject& metadata) = 0;

    // Up to k results ordered by descending score.
    virtual std::vector<VectorMatch> search(const std::vector<float>& queryVector, int k) = 0;

    virtual VectorStoreStats stats() const = 0;
};

} // namespace ss
