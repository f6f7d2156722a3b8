#pragma once

#include "core/shared/settings.h"

#include <QJsonObject>
#include <QString>

#include <optional>

namespace cw {

// SettingsManager -- JSON save/load for service settings.
//
// Settings are stored as a JSON file at:
//   <GenericConfigLocation>/codexwatcher/settings.json
// unless CODEXWATCHER_SETTINGS names another file.
class SettingsManager {
public:
    // Load settings from disk. Returns nullopt if file doesn't exist
    // or cannot be parsed.
    static std::optional<Settings> load();
    static std::optional<Settings> load(const QString& filePath);

    // Save settings to disk. Creates the directory if it doesn't exist.
    // Returns true on success.
    static bool save(const Settings& settings);
    static bool save(const Settings& settings, const QString& filePath);

    // Returns the settings file path (env override or default location).
    static QString settingsFilePath();

    // Defaults, then the settings file, then environment overrides.
    static Settings resolve();

    // Apply CODEX_DIR, CLAUDE_DIR, CODEXWATCHER_POLL_MS,
    // CODEXWATCHER_SEARCH_BUDGET_MS and CODEXWATCHER_SEARCH_MAX.
    static void applyEnvironmentOverrides(Settings& settings);

    // Convert settings to/from JSON. Missing keys keep their defaults.
    static QJsonObject toJson(const Settings& settings);
    static Settings fromJson(const QJsonObject& json);
};

} // namespace cw
