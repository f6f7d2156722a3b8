#pragma once

#include <QHash>
#include <QString>

namespace cw {

// Resume point for one tailed file.
struct FileCursor {
    qint64 offset = 0;    // bytes consumed so far
    int lineNo = 0;       // physical lines consumed so far
};

// CursorStore -- per-file (offset, line number) bookkeeping for incremental reads.
//
// Not internally synchronized: the IndexStore owns the only instance and
// touches it under its own lock.
class CursorStore {
public:
    // Cursor for path; a zero cursor when the path is unknown.
    FileCursor cursor(const QString& path) const;

    bool contains(const QString& path) const;

    // Record that a pass consumed up to offset / lineNo.
    void advance(const QString& path, qint64 offset, int lineNo);

    // Rewind to the start of the file so the next pass re-reads it.
    void reset(const QString& path);

    void erase(const QString& path);
    void clear();
    int size() const;

private:
    QHash<QString, FileCursor> m_cursors;
};

} // namespace cw
