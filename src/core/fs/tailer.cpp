#include "core/fs/tailer.h"
#include "core/shared/logging.h"

#include <QFile>
#include <QFileInfo>

namespace cw {

TailBatch Tailer::readFrom(const QString& path, const FileCursor& cursor)
{
    TailBatch batch;

    const QFileInfo info(path);
    batch.modifiedAt = info.lastModified();

    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARN(cwFs, "Cannot open transcript %s: %s", qUtf8Printable(path),
                 qUtf8Printable(file.errorString()));
        return batch;
    }
    batch.ok = true;

    qint64 offset = cursor.offset;
    int lineNo = cursor.lineNo;

    // A file shorter than the stored offset was truncated or replaced.
    if (offset > file.size() || !file.seek(offset)) {
        LOG_INFO(cwFs, "Transcript shrank below cursor (%lld > %lld), re-reading: %s",
                 static_cast<long long>(offset), static_cast<long long>(file.size()),
                 qUtf8Printable(path));
        batch.restarted = true;
        offset = 0;
        lineNo = 0;
        if (!file.seek(0)) {
            batch.ok = false;
            return batch;
        }
    }

    // When the previous pass stopped inside an unterminated line, the first
    // bytes read now finish that same physical line.
    bool continuesLine = false;
    if (offset > 0) {
        char previous = '\n';
        if (!file.seek(offset - 1) || !file.getChar(&previous) || !file.seek(offset)) {
            batch.ok = false;
            return batch;
        }
        continuesLine = previous != '\n';
    }

    batch.startOffset = offset;
    qint64 consumed = 0;
    while (!file.atEnd()) {
        QByteArray line = file.readLine();
        if (line.isEmpty()) {
            break;
        }
        consumed += line.size();
        if (continuesLine && lineNo > 0) {
            continuesLine = false;
        } else {
            ++lineNo;
        }

        if (line.endsWith('\n')) {
            line.chop(1);
        }
        if (line.trimmed().isEmpty()) {
            continue;
        }
        batch.lines.push_back(TailLine{lineNo, std::move(line)});
    }

    batch.endOffset = offset + consumed;
    batch.endLineNo = lineNo;
    return batch;
}

} // namespace cw
