#include "core/fs/path_normalizer.h"

#include <QDir>

namespace ss {

QString normalizeOperationPath(const QString& path, bool caseInsensitive)
{
    const QString trimmed = path.trimmed();
    if (trimmed.isEmpty()) {
        return {};
    }

    QString normalized = trimmed;
    normalized.replace(QLatin1Char('\\'), QLatin1Char('/'));
    normalized = QDir::cleanPath(normalized);
    if (caseInsensitive) {
        normalized = normalized.toLower();
    }
    return normalized;
}

} // namespace ss
