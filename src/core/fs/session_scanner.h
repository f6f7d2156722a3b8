#pragma once

#include "core/shared/types.h"

#include <QString>
#include <vector>

namespace cw {

// Provider roots scanned for transcript files.
struct ProviderRoots {
    QString codexDir;    // sessions live under <codexDir>/sessions
    QString claudeDir;   // one sub-directory per project
};

// One discovered transcript file.
struct SessionFile {
    Provider provider = Provider::Codex;
    QString project;      // Claude project folder, empty for Codex
    QString sessionKey;   // file-derived session key
    QString path;         // absolute path
    QString source;       // path relative to the provider root
};

// SessionScanner -- discovers candidate JSONL transcript files.
//
// Codex: every *.jsonl below <codexDir>/sessions (date-sharded folders are
// walked). Claude: every *.jsonl below each immediate project folder of
// claudeDir; the session key is "claude:<project>:<stem>" so stems that
// repeat across projects stay distinct.
class SessionScanner {
public:
    explicit SessionScanner(ProviderRoots roots);

    // Discover all candidate files, sorted by path. Missing roots yield nothing.
    std::vector<SessionFile> discover() const;

    // Session key for a Claude transcript.
    static QString claudeSessionKey(const QString& project, const QString& stem);

    // Path of file relative to root; the path itself when it lies outside.
    static QString relativeSource(const QString& root, const QString& path);

    const ProviderRoots& roots() const { return m_roots; }

private:
    void collectJsonl(const QString& dirPath, std::vector<QString>& out, int depth = 0) const;

    static bool isTranscriptFile(const QString& fileName);

    static constexpr int kMaxDepth = 16;

    ProviderRoots m_roots;
};

} // namespace cw
