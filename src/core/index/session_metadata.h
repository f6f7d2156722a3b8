#pragma once

#include <QString>

#include <optional>

namespace cw {

// Per-session overrides persisted beside the transcript as <stem>.meta.json.
struct SessionMetadata {
    QString customTitle;
};

class SessionMetadataStore {
public:
    // Sidecar path for a transcript file: same directory, same stem.
    static QString sidecarPathFor(const QString& transcriptPath);

    // nullopt when the file is missing, unreadable, not a JSON object or
    // carries only a blank title.
    static std::optional<SessionMetadata> load(const QString& sidecarPath);

    static bool save(const QString& sidecarPath, const SessionMetadata& metadata,
                     QString* errorOut = nullptr);

    // Missing file counts as success.
    static bool remove(const QString& sidecarPath, QString* errorOut = nullptr);
};

} // namespace cw
