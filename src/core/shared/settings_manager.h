#pragma once

#include "core/shared/settings.h"

#include <QJsonObject>
#include <QString>

#include <optional>

namespace ss {

// SettingsManager -- JSON save/load for pipeline settings.
//
// Settings are stored as a JSON file at:
//   <AppDataLocation>/stratosort/pipeline-settings.json
// Missing keys keep their PipelineSettings defaults.
class SettingsManager {
public:
    // Load settings from disk. Returns nullopt if file doesn't exist
    // or cannot be parsed.
    static std::optional<PipelineSettings> load();
    static std::optional<PipelineSettings> load(const QString& filePath);

    // Save settings to disk atomically. Returns true on success.
    static bool save(const PipelineSettings& settings);
    static bool save(const PipelineSettings& settings, const QString& filePath);

    static QString settingsFilePath();
    static QString defaultDataDir();

    // Data directory with the default applied.
    static QString resolveDataDir(const PipelineSettings& settings);

    static QJsonObject toJson(const PipelineSettings& settings);
    static PipelineSettings fromJson(const QJsonObject& json);
};

} // namespace ss
