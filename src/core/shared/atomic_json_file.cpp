#include "core/shared/atomic_json_file.h"
#include "core/shared/logging.h"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonParseError>
#include <QSaveFile>

namespace ss::atomic_json {

namespace {

void moveCorruptFileAside(const QString& filePath)
{
    const QString backupPath = filePath + QStringLiteral(".corrupt.")
                               + QString::number(QDateTime::currentMSecsSinceEpoch());
    if (QFile::rename(filePath, backupPath)) {
        LOG_WARN(ssCore, "Moved corrupt file aside: %s -> %s",
                 qUtf8Printable(filePath), qUtf8Printable(backupPath));
    } else {
        LOG_ERROR(ssCore, "Failed to move corrupt file aside: %s", qUtf8Printable(filePath));
    }
}

} // namespace

bool write(const QString& filePath, const QJsonDocument& doc, bool pretty)
{
    const QString parentDir = QFileInfo(filePath).absolutePath();
    if (!QDir().mkpath(parentDir)) {
        LOG_ERROR(ssCore, "Failed to create directory: %s", qUtf8Printable(parentDir));
        return false;
    }

    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        LOG_ERROR(ssCore, "Failed to open %s for write: %s",
                  qUtf8Printable(filePath), qUtf8Printable(file.errorString()));
        return false;
    }

    const QByteArray payload = doc.toJson(pretty ? QJsonDocument::Indented
                                                 : QJsonDocument::Compact);
    if (file.write(payload) != payload.size()) {
        LOG_ERROR(ssCore, "Short write to %s: %s",
                  qUtf8Printable(filePath), qUtf8Printable(file.errorString()));
        file.cancelWriting();
        return false;
    }

    if (!file.commit()) {
        LOG_ERROR(ssCore, "Failed to commit %s: %s",
                  qUtf8Printable(filePath), qUtf8Printable(file.errorString()));
        return false;
    }
    return true;
}

std::optional<QJsonDocument> load(const QString& filePath, const QString& description)
{
    QFile file(filePath);
    if (!file.exists()) {
        return std::nullopt;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        LOG_ERROR(ssCore, "Failed to open %s (%s): %s",
                  qUtf8Printable(description), qUtf8Printable(filePath),
                  qUtf8Printable(file.errorString()));
        return std::nullopt;
    }

    const QByteArray raw = file.readAll();
    file.close();

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(raw, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        LOG_ERROR(ssCore, "Failed to parse %s (%s): %s",
                  qUtf8Printable(description), qUtf8Printable(filePath),
                  qUtf8Printable(parseError.errorString()));
        moveCorruptFileAside(filePath);
        return std::nullopt;
    }

    return doc;
}

bool removeIfExists(const QString& filePath)
{
    QFile file(filePath);
    if (!file.exists()) {
        return true;
    }
    if (!file.remove()) {
        LOG_WARN(ssCore, "Failed to remove %s: %s",
                 qUtf8Printable(filePath), qUtf8Printable(file.errorString()));
        return false;
    }
    return true;
}

} // namespace ss::atomic_json
