#include <QtTest/QtTest>
#include "core/index/index_store.h"
#include "core/query/query_parser.h"
#include "core/query/search_executor.h"
#include "core/query/tool_fields.h"
#include "transcript_fixture.h"

#include <QDateTime>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTimeZone>

#include <memory>

using cw::test::TranscriptFixture;
using cw::test::jsonLine;
using cw::test::writeFile;

namespace {

QJsonObject chat(const QString& sessionId, const QString& id, const QString& role,
                 const QString& content, const QString& ts = QString())
{
    QJsonObject record{
        {QStringLiteral("session_id"), sessionId},
        {QStringLiteral("id"), id},
        {QStringLiteral("type"), QStringLiteral("message")},
        {QStringLiteral("role"), role},
        {QStringLiteral("content"), content},
    };
    if (!ts.isEmpty()) {
        record.insert(QStringLiteral("timestamp"), ts);
    }
    return record;
}

QJsonObject functionCall(const QString& sessionId, const QString& id, const QJsonArray& command)
{
    const QString arguments = QString::fromUtf8(QJsonDocument(
        QJsonObject{{QStringLiteral("command"), command}}).toJson(QJsonDocument::Compact));
    return QJsonObject{
        {QStringLiteral("session_id"), sessionId},
        {QStringLiteral("type"), QStringLiteral("response_item")},
        {QStringLiteral("payload"), QJsonObject{
            {QStringLiteral("type"), QStringLiteral("function_call")},
            {QStringLiteral("id"), id},
            {QStringLiteral("name"), QStringLiteral("shell")},
            {QStringLiteral("arguments"), arguments}}},
    };
}

QJsonObject functionOutput(const QString& sessionId, const QString& id, const QString& output)
{
    return QJsonObject{
        {QStringLiteral("session_id"), sessionId},
        {QStringLiteral("type"), QStringLiteral("response_item")},
        {QStringLiteral("payload"), QJsonObject{
            {QStringLiteral("type"), QStringLiteral("function_call_output")},
            {QStringLiteral("id"), id},
            {QStringLiteral("output"), output}}},
    };
}

QStringList hitIds(const cw::SearchResponse& response)
{
    QStringList ids;
    for (const cw::SearchHit& hit : response.hits) {
        ids.append(hit.messageId);
    }
    return ids;
}

} // anonymous namespace

class TestSearchExecutor : public QObject {
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    // ── Scope ────────────────────────────────────────────────────
    void testScopeIsolation();
    void testInToolsOverride();
    void testScopeAllReportsField();

    // ── Clauses ──────────────────────────────────────────────────
    void testPrefixAndWildcard();
    void testFieldFilterIsGlobalAnd();
    void testNegativeClauses();
    void testRegexCaseSensitivity();
    void testInvalidRegexMatchesNothing();
    void testCwdFilterIsSubstring();
    void testEmptyQueryMatchesEverything();

    // ── Paging and ordering ──────────────────────────────────────
    void testOffsetLimitAndTotal();
    void testLimitClampedToMaxReturn();
    void testHitsNewestFirst();
    void testPreviewTrimmedAndBounded();
    void testPreviewKeepsSurrogatePairs();
    void testBudgetTruncatesScan();

    // ── Tool fields ──────────────────────────────────────────────
    void testCodexToolFields();
    void testClaudeToolFields();

private:
    cw::SearchResponse search(const QString& query, const QString& scope = QString(),
                              int limit = 50, int offset = 0) const;
    void load(const QByteArray& codexLines);

    std::unique_ptr<TranscriptFixture> m_fixture;
    std::unique_ptr<cw::IndexStore> m_store;
    cw::SearchExecutor m_executor;
};

void TestSearchExecutor::init()
{
    m_fixture = std::make_unique<TranscriptFixture>();
    QVERIFY(m_fixture->isValid());
    m_store = std::make_unique<cw::IndexStore>(m_fixture->settings());
}

void TestSearchExecutor::cleanup()
{
    m_store.reset();
    m_fixture.reset();
}

cw::SearchResponse TestSearchExecutor::search(const QString& query, const QString& scope,
                                              int limit, int offset) const
{
    return m_executor.exec(*m_store, cw::QueryParser::parse(query, scope), limit, offset);
}

void TestSearchExecutor::load(const QByteArray& codexLines)
{
    QVERIFY(writeFile(m_fixture->codexFile(QStringLiteral("search.jsonl")), codexLines));
    m_store->scanOnce();
}

// ── Scope ────────────────────────────────────────────────────────

void TestSearchExecutor::testScopeIsolation()
{
    load(jsonLine(chat(QStringLiteral("s1"), QStringLiteral("u1"), QStringLiteral("user"),
                       QStringLiteral("please run the tests")))
         + jsonLine(functionCall(QStringLiteral("s1"), QStringLiteral("c1"),
                                 QJsonArray{QStringLiteral("cargo"), QStringLiteral("test")}))
         + jsonLine(functionOutput(QStringLiteral("s1"), QStringLiteral("o1"),
                                   QStringLiteral("cargo test finished: ok"))));

    const cw::SearchResponse tools = search(QStringLiteral("cargo"), QStringLiteral("tools"));
    QCOMPARE(tools.total, 2);
    QStringList ids = hitIds(tools);
    ids.sort();
    QCOMPARE(ids, QStringList({QStringLiteral("c1"), QStringLiteral("o1")}));
    for (const cw::SearchHit& hit : tools.hits) {
        if (hit.messageId == QLatin1String("c1")) {
            QCOMPARE(hit.field, cw::MatchField::ToolCommand);
            QCOMPARE(hit.preview, QStringLiteral("cargo test"));
        } else {
            QCOMPARE(hit.field, cw::MatchField::Stdout);
        }
    }

    const cw::SearchResponse content = search(QStringLiteral("cargo"), QStringLiteral("content"));
    QCOMPARE(content.total, 0);
    QVERIFY(content.hits.empty());

    // The user message is only reachable through content.
    QCOMPARE(search(QStringLiteral("please"), QStringLiteral("tools")).total, 0);
    QCOMPARE(search(QStringLiteral("please"), QStringLiteral("content")).total, 1);
}

void TestSearchExecutor::testInToolsOverride()
{
    load(jsonLine(functionCall(QStringLiteral("s1"), QStringLiteral("c1"),
                               QJsonArray{QStringLiteral("make"), QStringLiteral("all")})));

    QCOMPARE(search(QStringLiteral("make")).total, 0);
    const cw::SearchResponse response = search(QStringLiteral("in:tools make"));
    QCOMPARE(response.total, 1);
    QCOMPARE(response.hits[0].type, QStringLiteral("function_call"));
}

void TestSearchExecutor::testScopeAllReportsField()
{
    load(jsonLine(chat(QStringLiteral("s1"), QStringLiteral("u1"), QStringLiteral("user"),
                       QStringLiteral("deploy now")))
         + jsonLine(functionCall(QStringLiteral("s1"), QStringLiteral("c1"),
                                 QJsonArray{QStringLiteral("deploy.sh")})));

    const cw::SearchResponse response = search(QStringLiteral("deploy"), QStringLiteral("all"));
    QCOMPARE(response.total, 2);
    for (const cw::SearchHit& hit : response.hits) {
        QCOMPARE(hit.field, hit.messageId == QLatin1String("u1") ? cw::MatchField::Content
                                                                 : cw::MatchField::ToolCommand);
    }
}

// ── Clauses ──────────────────────────────────────────────────────

void TestSearchExecutor::testPrefixAndWildcard()
{
    load(jsonLine(chat(QStringLiteral("s1"), QStringLiteral("a"), QStringLiteral("user"),
                       QStringLiteral("go build")))
         + jsonLine(chat(QStringLiteral("s1"), QStringLiteral("b"), QStringLiteral("user"),
                         QStringLiteral("Good work")))
         + jsonLine(chat(QStringLiteral("s1"), QStringLiteral("c"), QStringLiteral("user"),
                         QStringLiteral("nothing here"))));

    QStringList prefix = hitIds(search(QStringLiteral("go*")));
    prefix.sort();
    QCOMPARE(prefix, QStringList({QStringLiteral("a"), QStringLiteral("b")}));

    const QStringList wildcard = hitIds(search(QStringLiteral("g*d")));
    QVERIFY(wildcard.contains(QStringLiteral("b")));
    QVERIFY(!wildcard.contains(QStringLiteral("c")));
}

void TestSearchExecutor::testFieldFilterIsGlobalAnd()
{
    load(jsonLine(chat(QStringLiteral("s1"), QStringLiteral("a1"), QStringLiteral("assistant"),
                       QStringLiteral("foo fighters")))
         + jsonLine(chat(QStringLiteral("s1"), QStringLiteral("u1"), QStringLiteral("user"),
                         QStringLiteral("bar none"))));

    // role:user sits in the first group but still filters the second.
    const cw::SearchResponse response = search(QStringLiteral("role:user foo OR bar"));
    QCOMPARE(hitIds(response), QStringList{QStringLiteral("u1")});

    QCOMPARE(search(QStringLiteral("role:assistant bar")).total, 0);
    QCOMPARE(hitIds(search(QStringLiteral("-role:user"))), QStringList{QStringLiteral("a1")});
    QCOMPARE(search(QStringLiteral("role:user OR role:assistant")).total, 2);
}

void TestSearchExecutor::testNegativeClauses()
{
    load(jsonLine(chat(QStringLiteral("s1"), QStringLiteral("a"), QStringLiteral("user"),
                       QStringLiteral("fix the parser")))
         + jsonLine(chat(QStringLiteral("s1"), QStringLiteral("b"), QStringLiteral("user"),
                         QStringLiteral("fix the lexer"))));

    QCOMPARE(hitIds(search(QStringLiteral("fix -parser"))), QStringList{QStringLiteral("b")});
    QCOMPARE(hitIds(search(QStringLiteral("-\"the lexer\""))), QStringList{QStringLiteral("a")});
}

void TestSearchExecutor::testRegexCaseSensitivity()
{
    load(jsonLine(chat(QStringLiteral("s1"), QStringLiteral("upper"), QStringLiteral("user"),
                       QStringLiteral("Error: disk full")))
         + jsonLine(chat(QStringLiteral("s1"), QStringLiteral("lower"), QStringLiteral("user"),
                         QStringLiteral("error: retry"))));

    QCOMPARE(hitIds(search(QStringLiteral("/^Error/"))), QStringList{QStringLiteral("upper")});
    QCOMPARE(search(QStringLiteral("/^error/i")).total, 2);
    QCOMPARE(hitIds(search(QStringLiteral("/dis\\w+/"))), QStringList{QStringLiteral("upper")});
}

void TestSearchExecutor::testInvalidRegexMatchesNothing()
{
    load(jsonLine(chat(QStringLiteral("s1"), QStringLiteral("a"), QStringLiteral("user"),
                       QStringLiteral("(anything"))));

    const cw::SearchResponse response = search(QStringLiteral("/(any/"));
    QCOMPARE(response.total, 0);
    QVERIFY(!response.truncated);
    // Negated, a never-matching clause excludes nothing.
    QCOMPARE(search(QStringLiteral("-/(any/")).total, 1);
}

void TestSearchExecutor::testCwdFilterIsSubstring()
{
    QJsonObject record = chat(QStringLiteral("s1"), QStringLiteral("a"), QStringLiteral("user"),
                              QStringLiteral("hello"));
    record.insert(QStringLiteral("cwd"), QStringLiteral("/home/user/Project1"));
    load(jsonLine(record)
         + jsonLine(chat(QStringLiteral("s2"), QStringLiteral("b"), QStringLiteral("user"),
                         QStringLiteral("hello"))));

    QCOMPARE(hitIds(search(QStringLiteral("cwd:/home/user hello"))), QStringList{QStringLiteral("a")});
    QCOMPARE(hitIds(search(QStringLiteral("cwd_base:project1"))), QStringList{QStringLiteral("a")});
    QCOMPARE(search(QStringLiteral("cwd_base:project")).total, 0);
}

void TestSearchExecutor::testEmptyQueryMatchesEverything()
{
    load(jsonLine(chat(QStringLiteral("s1"), QStringLiteral("a"), QStringLiteral("user"), QStringLiteral("x")))
         + jsonLine(chat(QStringLiteral("s1"), QStringLiteral("b"), QStringLiteral("assistant"), QStringLiteral("y"))));

    const cw::SearchResponse response = search(QString());
    QCOMPARE(response.total, 2);
    QCOMPARE(response.hits[0].field, cw::MatchField::Content);
    QCOMPARE(search(QString(), QStringLiteral("tools")).hits[0].field, cw::MatchField::ToolCommand);
}

// ── Paging and ordering ──────────────────────────────────────────

void TestSearchExecutor::testOffsetLimitAndTotal()
{
    QByteArray lines;
    for (int i = 1; i <= 5; ++i) {
        lines += jsonLine(chat(QStringLiteral("s1"), QStringLiteral("m%1").arg(i),
                               QStringLiteral("user"), QStringLiteral("needle %1").arg(i),
                               QStringLiteral("2025-01-01T00:0%1:00Z").arg(i)));
    }
    load(lines);

    const cw::SearchResponse page = search(QStringLiteral("needle"), QString(), 2, 1);
    QCOMPARE(page.total, 5);
    QVERIFY(!page.truncated);
    // The second and third matches in scan order, returned newest first.
    QCOMPARE(hitIds(page), QStringList({QStringLiteral("m3"), QStringLiteral("m2")}));

    const cw::SearchResponse pastEnd = search(QStringLiteral("needle"), QString(), 2, 10);
    QCOMPARE(pastEnd.total, 5);
    QVERIFY(pastEnd.hits.empty());

    const cw::SearchResponse defaults = search(QStringLiteral("needle"), QString(), 0, -3);
    QCOMPARE(static_cast<int>(defaults.hits.size()), 5);
}

void TestSearchExecutor::testLimitClampedToMaxReturn()
{
    QByteArray lines;
    for (int i = 1; i <= 6; ++i) {
        lines += jsonLine(chat(QStringLiteral("s1"), QStringLiteral("m%1").arg(i),
                               QStringLiteral("user"), QStringLiteral("needle")));
    }
    load(lines);

    cw::SearchLimits limits;
    limits.maxReturn = 3;
    const cw::SearchExecutor capped(limits);
    const cw::SearchResponse response =
        capped.exec(*m_store, cw::QueryParser::parse(QStringLiteral("needle")), 1000, 0);
    QCOMPARE(static_cast<int>(response.hits.size()), 3);
    QCOMPARE(response.total, 6);
}

void TestSearchExecutor::testHitsNewestFirst()
{
    load(jsonLine(chat(QStringLiteral("s1"), QStringLiteral("old"), QStringLiteral("user"),
                       QStringLiteral("needle"), QStringLiteral("2024-06-01T00:00:00Z")))
         + jsonLine(chat(QStringLiteral("s1"), QStringLiteral("undated"), QStringLiteral("user"),
                         QStringLiteral("needle")))
         + jsonLine(chat(QStringLiteral("s2"), QStringLiteral("new"), QStringLiteral("user"),
                         QStringLiteral("needle"), QStringLiteral("2025-06-01T00:00:00Z"))));

    const cw::SearchResponse response = search(QStringLiteral("needle"));
    QCOMPARE(hitIds(response),
             QStringList({QStringLiteral("new"), QStringLiteral("old"), QStringLiteral("undated")}));
    QCOMPARE(response.hits[0].sessionId, QStringLiteral("s2"));
    QCOMPARE(response.hits[0].source, QStringLiteral("sessions/search.jsonl"));
    QCOMPARE(response.hits[0].lineNo, 3);
    QVERIFY(!response.hits[2].timestamp.has_value());
}

void TestSearchExecutor::testPreviewTrimmedAndBounded()
{
    const QString longText = QStringLiteral("   needle ") + QString(500, QLatin1Char('x'));
    load(jsonLine(chat(QStringLiteral("s1"), QStringLiteral("a"), QStringLiteral("user"), longText)));

    const cw::SearchResponse response = search(QStringLiteral("needle"));
    QCOMPARE(response.hits[0].preview.size(), cw::SearchExecutor::kPreviewLength);
    QVERIFY(response.hits[0].preview.startsWith(QStringLiteral("needle")));
}

void TestSearchExecutor::testPreviewKeepsSurrogatePairs()
{
    const QString grin = QString::fromUcs4(U"\U0001F600");
    QString text = QStringLiteral("needle ");
    for (int i = 0; i < 300; ++i) {
        text += grin;
    }
    load(jsonLine(chat(QStringLiteral("s1"), QStringLiteral("a"), QStringLiteral("user"), text)));

    const QString preview = search(QStringLiteral("needle")).hits[0].preview;
    QCOMPARE(static_cast<int>(preview.toUcs4().size()), cw::SearchExecutor::kPreviewLength);
    QVERIFY(preview.endsWith(grin));
    QVERIFY(!preview.back().isHighSurrogate());
}

void TestSearchExecutor::testBudgetTruncatesScan()
{
    constexpr int kSessions = 200;
    constexpr int kPerSession = 100;
    const QDateTime base(QDate(2025, 1, 1), QTime(0, 0), QTimeZone::UTC);
    const QString padding(400, QLatin1Char('x'));

    QByteArray lines;
    for (int s = 0; s < kSessions; ++s) {
        for (int m = 0; m < kPerSession; ++m) {
            const int n = s * kPerSession + m;
            lines += jsonLine(chat(QStringLiteral("s%1").arg(s), QStringLiteral("m%1").arg(n),
                                   QStringLiteral("user"), QStringLiteral("Needle ") + padding,
                                   base.addSecs(n).toString(Qt::ISODate)));
        }
    }
    load(lines);
    QCOMPARE(m_store->stats().totalMessages, kSessions * kPerSession);

    cw::SearchLimits limits;
    limits.maxReturn = 200;
    limits.budgetMs = 1;
    const cw::SearchExecutor hurried(limits);
    const cw::SearchResponse response =
        hurried.exec(*m_store, cw::QueryParser::parse(QStringLiteral("needle")), 50, 0);

    QVERIFY(response.truncated);
    QVERIFY(response.total > 0);
    QVERIFY(response.total < kSessions * kPerSession);
    QVERIFY(!response.hits.empty());
    QVERIFY(static_cast<int>(response.hits.size()) <= 50);
    for (size_t i = 1; i < response.hits.size(); ++i) {
        QVERIFY(response.hits[i - 1].timestamp.value() >= response.hits[i].timestamp.value());
    }
    // The scan starts with the most recently active session.
    QCOMPARE(response.hits[0].sessionId, QStringLiteral("s%1").arg(kSessions - 1));
}

// ── Tool fields ──────────────────────────────────────────────────

void TestSearchExecutor::testCodexToolFields()
{
    cw::Message call;
    call.recordType = QStringLiteral("function_call");
    call.raw = QJsonObject{{QStringLiteral("arguments"), QStringLiteral("{\"command\":\"ls -la\"}")}};
    QCOMPARE(cw::tools::commandText(call), QStringLiteral("ls -la"));

    call.raw = QJsonObject{{QStringLiteral("arguments"), QStringLiteral("not json")}};
    QCOMPARE(cw::tools::commandText(call), QStringLiteral("not json"));

    cw::Message output;
    output.recordType = QStringLiteral("function_call_output");
    output.raw = QJsonObject{{QStringLiteral("payload"), QJsonObject{{QStringLiteral("output"),
        QStringLiteral("{\"stdout\":\"built\",\"stderr\":\"warning: unused\"}")}}}};
    QCOMPARE(cw::tools::stdoutText(output), QStringLiteral("built"));
    QCOMPARE(cw::tools::stderrText(output), QStringLiteral("warning: unused"));

    output.raw = QJsonObject{{QStringLiteral("output"), QStringLiteral("plain text")}};
    QCOMPARE(cw::tools::stdoutText(output), QStringLiteral("plain text"));
    QVERIFY(cw::tools::stderrText(output).isEmpty());

    cw::Message chatMessage;
    chatMessage.recordType = QStringLiteral("message");
    chatMessage.content = QStringLiteral("ls -la");
    QVERIFY(cw::tools::commandText(chatMessage).isEmpty());
}

void TestSearchExecutor::testClaudeToolFields()
{
    cw::Message message;
    message.provider = cw::Provider::Claude;
    message.raw = QJsonObject{{QStringLiteral("message"), QJsonObject{
        {QStringLiteral("content"), QJsonArray{
            QJsonObject{{QStringLiteral("type"), QStringLiteral("tool_use")},
                        {QStringLiteral("input"), QJsonObject{{QStringLiteral("command"), QStringLiteral("npm test")}}}},
            QJsonObject{{QStringLiteral("type"), QStringLiteral("tool_use")},
                        {QStringLiteral("input"), QJsonObject{{QStringLiteral("path"), QStringLiteral("/a")}}}},
            QJsonObject{{QStringLiteral("type"), QStringLiteral("tool_result")},
                        {QStringLiteral("content"), QStringLiteral("3 passed")}},
            QJsonObject{{QStringLiteral("type"), QStringLiteral("tool_result")},
                        {QStringLiteral("is_error"), true},
                        {QStringLiteral("content"), QJsonArray{
                            QJsonObject{{QStringLiteral("type"), QStringLiteral("text")},
                                        {QStringLiteral("text"), QStringLiteral("1 failed")}}}}}}}}}};

    QCOMPARE(cw::tools::commandText(message), QStringLiteral("npm test\n{\"path\":\"/a\"}"));
    QCOMPARE(cw::tools::stdoutText(message), QStringLiteral("3 passed"));
    QCOMPARE(cw::tools::stderrText(message), QStringLiteral("1 failed"));
}

QTEST_MAIN(TestSearchExecutor)
#include "test_search_executor.moc"
