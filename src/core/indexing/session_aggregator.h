#pragma once

#include "core/shared/types.h"

#include <QString>

namespace cw {

// Folds normalized messages into their session summary. Callers hold the
// Index Store write lock; counters are not idempotent, so each message
// must be applied exactly once.
class SessionAggregator {
public:
    static constexpr int kMaxTitleLength = 80;

    static void apply(Session& session, const Message& message);

    // Newlines become spaces; longer than kMaxTitleLength code points is cut
    // and suffixed with an ellipsis.
    static QString trimTitle(const QString& text);

    // Trimmed candidate, or empty if it repeats the session id, carries
    // environment metadata or looks machine-generated.
    static QString normalizeTitleCandidate(const QString& candidate, const Session& session);

    static bool looksLikeEnvironmentContext(const QString& text);
    static bool looksLikeGeneratedIdentifier(const QString& text);

    // cwd basename, then cwd, then the session id unless it looks generated.
    static QString fallbackTitle(const Session& session);

    static QString cwdBase(const QString& cwd);
};

} // namespace cw
