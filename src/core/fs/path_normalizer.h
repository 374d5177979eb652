#pragma once

#include <QString>

namespace ss {

// Canonical form used to key file-operation records: separators become '/',
// "." and ".." segments and duplicate separators are collapsed, and the
// result is lower-cased when `caseInsensitive` is set (Windows and default
// macOS volumes). Empty input stays empty.
QString normalizeOperationPath(const QString& path, bool caseInsensitive);

} // namespace ss
