#pragma once

#include <QJsonDocument>
#include <QString>

#include <optional>

namespace ss::atomic_json {

// Write a JSON document with write-new-then-rename semantics (QSaveFile).
// Creates the parent directory if needed. Readers never observe a partially
// written file: either the previous content or the complete new content.
bool write(const QString& filePath, const QJsonDocument& doc, bool pretty = false);

// Load a JSON document. Returns nullopt when the file does not exist, cannot
// be read, or cannot be parsed. Unparsable files are moved aside to
// "<filePath>.corrupt.<epochMs>" so the next write starts clean.
// `description` is used in log messages only.
std::optional<QJsonDocument> load(const QString& filePath, const QString& description);

// Remove a file if it exists. Returns false only when removal failed.
bool removeIfExists(const QString& filePath);

} // namespace ss::atomic_json
