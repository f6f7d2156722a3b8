#pragma once

#include "core/fs/session_scanner.h"
#include "core/indexing/cursor_store.h"
#include "core/shared/settings.h"
#include "core/shared/types.h"

#include <QByteArray>
#include <QHash>
#include <QMap>
#include <QString>

#include <deque>
#include <optional>
#include <shared_mutex>
#include <vector>

namespace cw {

// Outcome of a write operation against the index and its backing files.
struct MutationResult {
    enum class Status {
        Ok,
        NotFound,          // unknown session or message id
        InvalidArgument,   // request rejected before touching any state
        IoError,           // filesystem step failed; in-memory state unchanged
    };

    Status status = Status::Ok;
    QString error;

    bool ok() const { return status == Status::Ok; }

    static MutationResult success() { return {}; }
    static MutationResult notFound(const QString& message)
    {
        return {Status::NotFound, message};
    }
    static MutationResult invalidArgument(const QString& message)
    {
        return {Status::InvalidArgument, message};
    }
    static MutationResult ioError(const QString& message)
    {
        return {Status::IoError, message};
    }
};

// IndexStore -- owns every Session and Message and the per-file cursors.
//
// One reader/writer lock guards all state. Readers build full copies under
// the shared lock; ingestion and mutations hold the exclusive lock, including
// the file read of each tail pass and the rewrite of a message deletion, so
// on-disk and in-memory state never diverge under concurrent calls.
//
// A tail pass that starts at offset 0 for a file that already contributed
// (cursor reset by deleteMessage, or truncation) first purges that file's
// messages and counter contributions, so a re-read never double-counts.
class IndexStore {
public:
    explicit IndexStore(const Settings& settings);

    IndexStore(const IndexStore&) = delete;
    IndexStore& operator=(const IndexStore&) = delete;

    // Snapshot sorted by last_at descending (sessions without timestamps last).
    std::vector<Session> sessions() const;
    std::optional<Session> session(const QString& sessionId) const;
    bool hasSession(const QString& sessionId) const;

    // Most recent `limit` messages in ingestion order; all when limit <= 0.
    std::vector<Message> messages(const QString& sessionId, int limit) const;

    IndexStats stats() const;

    // One poll cycle: discover files and tail each from its cursor.
    // Returns the number of files visited.
    int scanOnce();

    // Parse and apply one line from file. Does not move the file's cursor.
    void ingestLine(const SessionFile& file, int lineNo, const QByteArray& bytes);

    // Drop all state and cursors, then scan every file from byte zero.
    void reindex();

    MutationResult deleteSession(const QString& sessionId);
    MutationResult deleteMessage(const QString& sessionId, const QString& messageId);
    MutationResult updateSessionTitle(const QString& sessionId, const QString& title);

    const ProviderRoots& roots() const { return m_roots; }

private:
    // What one file contributed to one session, so it can be taken back.
    struct Contribution {
        int messages = 0;
        int texts = 0;
        QMap<QString, int> roles;
        QMap<QString, int> models;
        QMap<QString, int> fields;
    };

    struct FileTally {
        int badLines = 0;
        QHash<QString, Contribution> sessions;
    };

    void tailFileLocked(const SessionFile& file);
    void ingestLocked(const SessionFile& file, int lineNo, const QByteArray& bytes);
    Session& sessionForLocked(const Message& message, const SessionFile& file);
    void purgeFileLocked(const QString& path, Provider provider, const QString& source);
    void clearLocked();

    QString absolutePath(Provider provider, const QString& source) const;
    QString metadataPathLocked(const Session& session) const;

    ProviderRoots m_roots;
    int m_maxMessagesPerSession;

    mutable std::shared_mutex m_mutex;
    QHash<QString, Session> m_sessions;
    QHash<QString, std::deque<Message>> m_messages;
    QHash<QString, FileTally> m_tallies;   // keyed by absolute file path
    CursorStore m_cursors;
    IndexStats m_stats;
};

} // namespace cw
