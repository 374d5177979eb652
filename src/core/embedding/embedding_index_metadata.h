#pragma once

#include <QDateTime>
#include <QString>

#include <optional>

namespace ss {

// Identity of the embeddings currently stored in the vector index.
// Persisted as {model, dimensions, updatedAt} in embedding-index.json.
struct EmbeddingIndexMetadata {
    QString model;
    int dimensions = 0;
    QDateTime updatedAt;
};

QString embeddingIndexMetadataPath(const QString& dataDir);

std::optional<EmbeddingIndexMetadata> readEmbeddingIndexMetadata(const QString& filePath);

// Stamps updatedAt with the current UTC time and writes atomically.
bool writeEmbeddingIndexMetadata(const QString& filePath, const QString& model, int dimensions);

// True when the stored identity differs from (model, dimensions) or is absent.
bool embeddingIdentityChanged(const std::optional<EmbeddingIndexMetadata>& stored,
                              const QString& model, int dimensions);

} // namespace ss
