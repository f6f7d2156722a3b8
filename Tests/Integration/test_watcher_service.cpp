#include <QtTest/QtTest>

#include "core/ipc/message.h"
#include "core/shared/ipc_messages.h"
#include "services/watcher/watcher_service.h"
#include "transcript_fixture.h"

#include <QDir>
#include <QJsonArray>
#include <QJsonObject>
#include <QLocalSocket>
#include <QTemporaryDir>

using cw::test::ScopedEnvVar;
using cw::test::TranscriptFixture;
using cw::test::countLines;
using cw::test::jsonLine;
using cw::test::writeFile;

namespace {

// Exposes the dispatcher and the socket server to the test.
class TestableWatcherService : public cw::WatcherService {
public:
    using cw::WatcherService::WatcherService;
    using cw::WatcherService::handleRequest;

    cw::SocketServer& server() { return *m_server; }
};

QByteArray transcript()
{
    const auto record = [](const QString& session, const QString& id, const QString& role,
                           const QString& content, const QString& ts) {
        return jsonLine(QJsonObject{
            {QStringLiteral("session_id"), session},
            {QStringLiteral("id"), id},
            {QStringLiteral("role"), role},
            {QStringLiteral("content"), content},
            {QStringLiteral("timestamp"), ts},
        });
    };
    return record(QStringLiteral("s1"), QStringLiteral("m1"), QStringLiteral("user"),
                  QStringLiteral("Build a CLI tool"), QStringLiteral("2025-01-15T10:00:00Z"))
        + record(QStringLiteral("s1"), QStringLiteral("m2"), QStringLiteral("assistant"),
                 QStringLiteral("Sure, here is a plan"), QStringLiteral("2025-01-15T10:01:00Z"))
        + record(QStringLiteral("s2"), QStringLiteral("m3"), QStringLiteral("user"),
                 QStringLiteral("Let's start"), QStringLiteral("2025-01-15T11:00:00Z"));
}

QJsonObject call(TestableWatcherService& service, const QString& method,
                 const QJsonObject& params = {})
{
    static qint64 nextId = 1;
    return service.handleRequest(cw::IpcMessage::makeRequest(nextId++, method, params));
}

QString errorCode(const QJsonObject& envelope)
{
    return envelope.value(QStringLiteral("error")).toObject()
        .value(QStringLiteral("codeString")).toString();
}

QJsonObject resultOf(const QJsonObject& envelope)
{
    return envelope.value(QStringLiteral("result")).toObject();
}

} // anonymous namespace

class TestWatcherService : public QObject {
    Q_OBJECT

private slots:
    void testReadMethods();
    void testSearchMethod();
    void testMutationMethods();
    void testParameterValidation();
    void testUnknownMethodAndPing();
    void testPollingPicksUpNewFiles();
    void testSocketRoundTrip();
};

void TestWatcherService::testReadMethods()
{
    TranscriptFixture fixture;
    QVERIFY(fixture.isValid());
    QVERIFY(writeFile(fixture.codexFile(QStringLiteral("a.jsonl")), transcript()));

    TestableWatcherService service(fixture.settings());
    service.store().scanOnce();

    const QJsonObject sessions = resultOf(call(service, QStringLiteral("getSessions")));
    const QJsonArray list = sessions.value(QStringLiteral("sessions")).toArray();
    QCOMPARE(list.size(), 2);
    QCOMPARE(list.at(0).toObject().value(QStringLiteral("id")).toString(), QStringLiteral("s2"));

    const QJsonObject messages = resultOf(call(service, QStringLiteral("getMessages"),
        QJsonObject{{QStringLiteral("sessionId"), QStringLiteral("s1")},
                    {QStringLiteral("limit"), 1}}));
    const QJsonArray messageList = messages.value(QStringLiteral("messages")).toArray();
    QCOMPARE(messageList.size(), 1);
    QCOMPARE(messageList.at(0).toObject().value(QStringLiteral("role")).toString(),
             QStringLiteral("assistant"));

    const QJsonObject stats = resultOf(call(service, QStringLiteral("getStats")));
    QCOMPARE(stats.value(QStringLiteral("total_messages")).toInt(), 3);
    QCOMPARE(stats.value(QStringLiteral("total_sessions")).toInt(), 2);

    const QJsonObject reindexed = resultOf(call(service, QStringLiteral("reindex")));
    QVERIFY(reindexed.value(QStringLiteral("reindexed")).toBool());
    QCOMPARE(reindexed.value(QStringLiteral("stats")).toObject()
                 .value(QStringLiteral("total_messages")).toInt(), 3);
}

void TestWatcherService::testSearchMethod()
{
    TranscriptFixture fixture;
    QVERIFY(fixture.isValid());
    QVERIFY(writeFile(fixture.codexFile(QStringLiteral("a.jsonl")), transcript()));

    TestableWatcherService service(fixture.settings());
    service.store().scanOnce();

    const QJsonObject response = resultOf(call(service, QStringLiteral("search"),
        QJsonObject{{QStringLiteral("query"), QStringLiteral("plan OR start")},
                    {QStringLiteral("scope"), QStringLiteral("content")},
                    {QStringLiteral("limit"), 10}}));
    QCOMPARE(response.value(QStringLiteral("total")).toInt(), 2);
    QCOMPARE(response.value(QStringLiteral("truncated")).toBool(), false);
    const QJsonArray hits = response.value(QStringLiteral("hits")).toArray();
    QCOMPARE(hits.size(), 2);
    QCOMPARE(hits.at(0).toObject().value(QStringLiteral("message_id")).toString(),
             QStringLiteral("m3"));
    QCOMPARE(hits.at(0).toObject().value(QStringLiteral("field")).toString(),
             QStringLiteral("content"));

    // Missing query is the empty query.
    const QJsonObject all = resultOf(call(service, QStringLiteral("search")));
    QCOMPARE(all.value(QStringLiteral("total")).toInt(), 3);
}

void TestWatcherService::testMutationMethods()
{
    TranscriptFixture fixture;
    QVERIFY(fixture.isValid());
    const QString path = fixture.codexFile(QStringLiteral("a.jsonl"));
    QVERIFY(writeFile(path, transcript()));

    TestableWatcherService service(fixture.settings());
    service.store().scanOnce();

    const QJsonObject retitled = resultOf(call(service, QStringLiteral("updateSessionTitle"),
        QJsonObject{{QStringLiteral("sessionId"), QStringLiteral("s1")},
                    {QStringLiteral("title"), QStringLiteral("CLI work")}}));
    QCOMPARE(retitled.value(QStringLiteral("session")).toObject()
                 .value(QStringLiteral("title")).toString(), QStringLiteral("CLI work"));

    const QJsonObject deleted = call(service, QStringLiteral("deleteMessage"),
        QJsonObject{{QStringLiteral("sessionId"), QStringLiteral("s1")},
                    {QStringLiteral("messageId"), QStringLiteral("m1")}});
    QCOMPARE(deleted.value(QStringLiteral("type")).toString(), QStringLiteral("response"));
    QCOMPARE(countLines(path), 2);

    const QJsonObject missing = call(service, QStringLiteral("deleteMessage"),
        QJsonObject{{QStringLiteral("sessionId"), QStringLiteral("s1")},
                    {QStringLiteral("messageId"), QStringLiteral("m1")}});
    QCOMPARE(errorCode(missing), QStringLiteral("NOT_FOUND"));

    QCOMPARE(errorCode(call(service, QStringLiteral("deleteSession"),
        QJsonObject{{QStringLiteral("sessionId"), QStringLiteral("ghost")}})),
             QStringLiteral("NOT_FOUND"));
    QCOMPARE(errorCode(call(service, QStringLiteral("updateSessionTitle"),
        QJsonObject{{QStringLiteral("sessionId"), QStringLiteral("ghost")},
                    {QStringLiteral("title"), QStringLiteral("x")}})),
             QStringLiteral("NOT_FOUND"));

    const QJsonObject sessionGone = call(service, QStringLiteral("deleteSession"),
        QJsonObject{{QStringLiteral("sessionId"), QStringLiteral("s1")}});
    QVERIFY(resultOf(sessionGone).value(QStringLiteral("deleted")).toBool());
    QVERIFY(!QFile::exists(path));
    QVERIFY(!service.store().hasSession(QStringLiteral("s1")));
}

void TestWatcherService::testParameterValidation()
{
    TranscriptFixture fixture;
    QVERIFY(fixture.isValid());
    TestableWatcherService service(fixture.settings());

    QCOMPARE(errorCode(call(service, QStringLiteral("getMessages"))),
             QStringLiteral("INVALID_PARAMS"));
    QCOMPARE(errorCode(call(service, QStringLiteral("getMessages"),
        QJsonObject{{QStringLiteral("sessionId"), QStringLiteral("nope")}})),
             QStringLiteral("NOT_FOUND"));
    QCOMPARE(errorCode(call(service, QStringLiteral("search"),
        QJsonObject{{QStringLiteral("query"), 42}})),
             QStringLiteral("INVALID_PARAMS"));
    QCOMPARE(errorCode(call(service, QStringLiteral("deleteMessage"),
        QJsonObject{{QStringLiteral("sessionId"), QStringLiteral("s1")}})),
             QStringLiteral("INVALID_PARAMS"));
    QCOMPARE(errorCode(call(service, QStringLiteral("updateSessionTitle"),
        QJsonObject{{QStringLiteral("sessionId"), QStringLiteral("s1")},
                    {QStringLiteral("title"), QStringLiteral("   ")}})),
             QStringLiteral("INVALID_PARAMS"));
    QCOMPARE(errorCode(call(service, QStringLiteral("deleteSession"))),
             QStringLiteral("INVALID_PARAMS"));
}

void TestWatcherService::testUnknownMethodAndPing()
{
    TranscriptFixture fixture;
    QVERIFY(fixture.isValid());
    TestableWatcherService service(fixture.settings());

    QCOMPARE(errorCode(call(service, QStringLiteral("frobnicate"))), QStringLiteral("NOT_FOUND"));

    const QJsonObject pong = resultOf(call(service, QStringLiteral("ping")));
    QVERIFY(pong.value(QStringLiteral("pong")).toBool());
    QCOMPARE(pong.value(QStringLiteral("service")).toString(), QStringLiteral("codexwatcher-test"));
}

void TestWatcherService::testPollingPicksUpNewFiles()
{
    TranscriptFixture fixture;
    QVERIFY(fixture.isValid());
    cw::Settings settings = fixture.settings();
    settings.pollIntervalMs = 25;

    TestableWatcherService service(settings);
    service.startPolling();
    QVERIFY(service.isPolling());

    QVERIFY(writeFile(fixture.codexFile(QStringLiteral("late.jsonl")), transcript()));
    QTRY_COMPARE_WITH_TIMEOUT(service.store().stats().totalMessages, 3, 5000);

    service.stopPolling();
    QVERIFY(!service.isPolling());
}

void TestWatcherService::testSocketRoundTrip()
{
    TranscriptFixture fixture;
    QVERIFY(fixture.isValid());
    QVERIFY(writeFile(fixture.codexFile(QStringLiteral("a.jsonl")), transcript()));

    QTemporaryDir runtime;
    QVERIFY(runtime.isValid());
    ScopedEnvVar runtimeDir("CODEXWATCHER_RUNTIME_DIR", runtime.path().toUtf8());

    TestableWatcherService service(fixture.settings());
    service.store().scanOnce();
    const QString socketPath = cw::ServiceBase::socketPath(service.serviceName());
    QVERIFY(socketPath.startsWith(runtime.path()));
    QVERIFY(service.server().listen(socketPath));

    QLocalSocket client;
    client.connectToServer(socketPath);
    QTRY_COMPARE(client.state(), QLocalSocket::ConnectedState);

    client.write(cw::IpcMessage::encode(cw::IpcMessage::makeRequest(
        77, QStringLiteral("getStats"))));
    client.flush();

    QByteArray buffer;
    cw::IpcMessage::Frame frame;
    QTRY_VERIFY_WITH_TIMEOUT(
        (buffer.append(client.readAll()),
         frame = cw::IpcMessage::decode(buffer),
         frame.status == cw::IpcMessage::Frame::Status::Ok),
        5000);

    QCOMPARE(cw::IpcMessage::requestId(frame.json), qint64(77));
    QCOMPARE(frame.json.value(QStringLiteral("type")).toString(), QStringLiteral("response"));
    QCOMPARE(resultOf(frame.json).value(QStringLiteral("total_messages")).toInt(), 3);

    client.disconnectFromServer();
    service.server().close();
}

QTEST_MAIN(TestWatcherService)
#include "test_watcher_service.moc"
