#include "core/embedding/embedding_index_metadata.h"
#include "core/shared/atomic_json_file.h"
#include "core/shared/logging.h"

#include <QJsonDocument>
#include <QJsonObject>

namespace ss {

QString embeddingIndexMetadataPath(const QString& dataDir)
{
    return dataDir + QStringLiteral("/embedding-index.json");
}

std::optional<EmbeddingIndexMetadata> readEmbeddingIndexMetadata(const QString& filePath)
{
    const std::optional<QJsonDocument> doc =
        atomic_json::load(filePath, QStringLiteral("embedding index metadata"));
    if (!doc || !doc->isObject()) {
        return std::nullopt;
    }

    const QJsonObject obj = doc->object();
    EmbeddingIndexMetadata meta;
    meta.model = obj.value(QStringLiteral("model")).toString();
    meta.dimensions = obj.value(QStringLiteral("dimensions")).toInt(0);
    meta.updatedAt = QDateTime::fromString(obj.value(QStringLiteral("updatedAt")).toString(),
                                           Qt::ISODateWithMs);
    if (meta.model.isEmpty() && meta.dimensions <= 0) {
        LOG_WARN(ssEmbed, "Embedding index metadata has no model or dimensions: %s",
                 qUtf8Printable(filePath));
        return std::nullopt;
    }
    return meta;
}

bool writeEmbeddingIndexMetadata(const QString& filePath, const QString& model, int dimensions)
{
    QJsonObject obj;
    obj.insert(QStringLiteral("model"), model);
    obj.insert(QStringLiteral("dimensions"), dimensions);
    obj.insert(QStringLiteral("updatedAt"),
               QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs));

    if (!atomic_json::write(filePath, QJsonDocument(obj), true)) {
        LOG_ERROR(ssEmbed, "Failed to write embedding index metadata: %s", qUtf8Printable(filePath));
        return false;
    }
    LOG_INFO(ssEmbed, "Embedding index metadata updated: model=%s dimensions=%d",
             qUtf8Printable(model), dimensions);
    return true;
}

bool embeddingIdentityChanged(const std::optional<EmbeddingIndexMetadata>& stored,
                              const QString& model, int dimensions)
{
    if (!stored) {
        return true;
    }
    return stored->model != model || stored->dimensions != dimensions;
}

} // namespace ss
