#pragma once

#include "core/indexing/cursor_store.h"

#include <QByteArray>
#include <QDateTime>
#include <QString>
#include <vector>

namespace cw {

struct TailLine {
    int lineNo = 0;       // 1-based physical line number
    QByteArray bytes;     // line without the trailing newline
};

// Result of one incremental pass over a file.
struct TailBatch {
    bool ok = false;          // false when the file could not be opened
    bool restarted = false;   // stored offset was past EOF; re-read from 0
    qint64 startOffset = 0;
    qint64 endOffset = 0;
    int endLineNo = 0;
    QDateTime modifiedAt;
    std::vector<TailLine> lines;   // non-blank lines only
};

// Tailer -- reads whole lines appended to a file since a cursor.
//
// Every byte read in a pass is consumed, including an unterminated line at
// EOF: it is forwarded as-is and its remainder is forwarded on a later pass
// under the same line number, so line numbers stay physical.
class Tailer {
public:
    static TailBatch readFrom(const QString& path, const FileCursor& cursor);
};

} // namespace cw
