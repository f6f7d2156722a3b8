#pragma once

#include <QHash>
#include <QJsonObject>
#include <QLocalServer>
#include <QLocalSocket>
#include <QObject>

#include <functional>
#include <memory>

namespace cw {

// SocketServer -- QLocalServer speaking the length-prefixed JSON protocol.
//
// Each complete request frame is passed to the handler on the server's
// thread and the returned envelope is written back to the same client.
class SocketServer : public QObject {
    Q_OBJECT
public:
    using RequestHandler = std::function<QJsonObject(const QJsonObject& request)>;

    static constexpr int kMaxPendingBytes = 32 * 1024 * 1024;

    explicit SocketServer(QObject* parent = nullptr);
    ~SocketServer() override;

    // Replaces a stale socket file left by a dead process; refuses to steal
    // one that still has a live listener.
    bool listen(const QString& socketPath);
    void close();
    bool isListening() const;
    int clientCount() const { return static_cast<int>(m_pending.size()); }

    void setRequestHandler(RequestHandler handler);

signals:
    void clientConnected();
    void clientDisconnected();
    void errorOccurred(const QString& error);

private slots:
    void onNewConnection();
    void onReadyRead();
    void onDisconnected();

private:
    void drain(QLocalSocket* client);
    void dropClient(QLocalSocket* client);

    std::unique_ptr<QLocalServer> m_server;
    QHash<QLocalSocket*, QByteArray> m_pending;
    RequestHandler m_handler;
};

} // namespace cw
