#include <QtTest/QtTest>
#include "core/fs/tailer.h"
#include "core/indexing/cursor_store.h"
#include "transcript_fixture.h"

#include <QDir>

using cw::test::appendToFile;
using cw::test::writeFile;

class TestTailer : public QObject {
    Q_OBJECT

private slots:
    // ── Tailer ───────────────────────────────────────────────────
    void testReadsNonBlankLinesWithPhysicalNumbers();
    void testResumesFromCursor();
    void testUnterminatedLineIsConsumed();
    void testFinishedLineKeepsItsNumber();
    void testCursorPastEofRestarts();
    void testMissingFileNotOk();
    void testCrlfLinesKeepContent();

    // ── CursorStore ──────────────────────────────────────────────
    void testUnknownPathHasZeroCursor();
    void testAdvanceAndReset();
    void testEraseAndClear();
};

// ── Tailer ───────────────────────────────────────────────────────

void TestTailer::testReadsNonBlankLinesWithPhysicalNumbers()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = QDir(dir.path()).filePath(QStringLiteral("a.jsonl"));
    QVERIFY(writeFile(path, "a\n\nb\n"));

    const cw::TailBatch batch = cw::Tailer::readFrom(path, cw::FileCursor());
    QVERIFY(batch.ok);
    QVERIFY(!batch.restarted);
    QCOMPARE(batch.startOffset, qint64(0));
    QCOMPARE(batch.endOffset, qint64(5));
    QCOMPARE(batch.endLineNo, 3);
    QCOMPARE(static_cast<int>(batch.lines.size()), 2);
    QCOMPARE(batch.lines[0].lineNo, 1);
    QCOMPARE(batch.lines[0].bytes, QByteArray("a"));
    QCOMPARE(batch.lines[1].lineNo, 3);
    QCOMPARE(batch.lines[1].bytes, QByteArray("b"));
    QVERIFY(batch.modifiedAt.isValid());
}

void TestTailer::testResumesFromCursor()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = QDir(dir.path()).filePath(QStringLiteral("a.jsonl"));
    QVERIFY(writeFile(path, "first\nsecond\n"));

    const cw::TailBatch first = cw::Tailer::readFrom(path, cw::FileCursor());
    QCOMPARE(static_cast<int>(first.lines.size()), 2);

    QVERIFY(appendToFile(path, "third\n"));
    cw::FileCursor cursor;
    cursor.offset = first.endOffset;
    cursor.lineNo = first.endLineNo;
    const cw::TailBatch second = cw::Tailer::readFrom(path, cursor);
    QVERIFY(second.ok);
    QCOMPARE(second.startOffset, first.endOffset);
    QCOMPARE(static_cast<int>(second.lines.size()), 1);
    QCOMPARE(second.lines[0].lineNo, 3);
    QCOMPARE(second.lines[0].bytes, QByteArray("third"));

    // Nothing new: an empty pass leaves the cursor where it was.
    cursor.offset = second.endOffset;
    cursor.lineNo = second.endLineNo;
    const cw::TailBatch idle = cw::Tailer::readFrom(path, cursor);
    QVERIFY(idle.ok);
    QVERIFY(idle.lines.empty());
    QCOMPARE(idle.endOffset, cursor.offset);
    QCOMPARE(idle.endLineNo, cursor.lineNo);
}

void TestTailer::testUnterminatedLineIsConsumed()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = QDir(dir.path()).filePath(QStringLiteral("a.jsonl"));
    QVERIFY(writeFile(path, "x\ny"));

    const cw::TailBatch batch = cw::Tailer::readFrom(path, cw::FileCursor());
    QVERIFY(batch.ok);
    QCOMPARE(batch.endOffset, qint64(3));
    QCOMPARE(batch.endLineNo, 2);
    QCOMPARE(static_cast<int>(batch.lines.size()), 2);
    QCOMPARE(batch.lines[1].lineNo, 2);
    QCOMPARE(batch.lines[1].bytes, QByteArray("y"));
}

void TestTailer::testFinishedLineKeepsItsNumber()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = QDir(dir.path()).filePath(QStringLiteral("a.jsonl"));
    QVERIFY(writeFile(path, "x\n{\"id\":"));

    const cw::TailBatch first = cw::Tailer::readFrom(path, cw::FileCursor());
    QCOMPARE(first.endLineNo, 2);

    // The writer finishes line 2 and appends line 3.
    QVERIFY(appendToFile(path, "1}\nz\n"));
    cw::FileCursor cursor;
    cursor.offset = first.endOffset;
    cursor.lineNo = first.endLineNo;
    const cw::TailBatch second = cw::Tailer::readFrom(path, cursor);
    QVERIFY(second.ok);
    QCOMPARE(second.startOffset, first.endOffset);
    QCOMPARE(static_cast<int>(second.lines.size()), 2);
    QCOMPARE(second.lines[0].lineNo, 2);
    QCOMPARE(second.lines[0].bytes, QByteArray("1}"));
    QCOMPARE(second.lines[1].lineNo, 3);
    QCOMPARE(second.lines[1].bytes, QByteArray("z"));
    QCOMPARE(second.endLineNo, 3);
}

void TestTailer::testCursorPastEofRestarts()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = QDir(dir.path()).filePath(QStringLiteral("a.jsonl"));
    QVERIFY(writeFile(path, "short\n"));

    cw::FileCursor cursor;
    cursor.offset = 1000;
    cursor.lineNo = 40;
    const cw::TailBatch batch = cw::Tailer::readFrom(path, cursor);
    QVERIFY(batch.ok);
    QVERIFY(batch.restarted);
    QCOMPARE(batch.startOffset, qint64(0));
    QCOMPARE(static_cast<int>(batch.lines.size()), 1);
    QCOMPARE(batch.lines[0].lineNo, 1);
}

void TestTailer::testMissingFileNotOk()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const cw::TailBatch batch = cw::Tailer::readFrom(
        QDir(dir.path()).filePath(QStringLiteral("missing.jsonl")), cw::FileCursor());
    QVERIFY(!batch.ok);
    QVERIFY(batch.lines.empty());
}

void TestTailer::testCrlfLinesKeepContent()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = QDir(dir.path()).filePath(QStringLiteral("a.jsonl"));
    QVERIFY(writeFile(path, "{\"a\":1}\r\n\r\n{\"b\":2}\r\n"));

    const cw::TailBatch batch = cw::Tailer::readFrom(path, cw::FileCursor());
    QVERIFY(batch.ok);
    QCOMPARE(batch.endLineNo, 3);
    QCOMPARE(static_cast<int>(batch.lines.size()), 2);
    QCOMPARE(batch.lines[1].lineNo, 3);
    QVERIFY(batch.lines[1].bytes.startsWith("{\"b\":2}"));
}

// ── CursorStore ──────────────────────────────────────────────────

void TestTailer::testUnknownPathHasZeroCursor()
{
    cw::CursorStore store;
    QVERIFY(!store.contains(QStringLiteral("/nope")));
    const cw::FileCursor cursor = store.cursor(QStringLiteral("/nope"));
    QCOMPARE(cursor.offset, qint64(0));
    QCOMPARE(cursor.lineNo, 0);
    QCOMPARE(store.size(), 0);
}

void TestTailer::testAdvanceAndReset()
{
    cw::CursorStore store;
    const QString path = QStringLiteral("/tmp/s.jsonl");
    store.advance(path, 120, 4);
    QVERIFY(store.contains(path));
    QCOMPARE(store.cursor(path).offset, qint64(120));
    QCOMPARE(store.cursor(path).lineNo, 4);

    store.reset(path);
    QVERIFY(store.contains(path));
    QCOMPARE(store.cursor(path).offset, qint64(0));
    QCOMPARE(store.cursor(path).lineNo, 0);
}

void TestTailer::testEraseAndClear()
{
    cw::CursorStore store;
    store.advance(QStringLiteral("/a"), 1, 1);
    store.advance(QStringLiteral("/b"), 2, 2);
    QCOMPARE(store.size(), 2);

    store.erase(QStringLiteral("/a"));
    QVERIFY(!store.contains(QStringLiteral("/a")));
    QCOMPARE(store.size(), 1);

    store.clear();
    QCOMPARE(store.size(), 0);
}

QTEST_MAIN(TestTailer)
#include "test_tailer.moc"
