#include "core/ipc/socket_server.h"
#include "core/ipc/message.h"
#include "core/shared/logging.h"

namespace cw {

namespace {

bool hasLiveListener(const QString& socketPath)
{
    QLocalSocket probe;
    probe.connectToServer(socketPath);
    if (!probe.waitForConnected(150)) {
        return false;
    }
    probe.disconnectFromServer();
    return true;
}

} // namespace

SocketServer::SocketServer(QObject* parent)
    : QObject(parent)
    , m_server(std::make_unique<QLocalServer>(this))
{
    connect(m_server.get(), &QLocalServer::newConnection, this, &SocketServer::onNewConnection);
}

SocketServer::~SocketServer()
{
    close();
}

bool SocketServer::listen(const QString& socketPath)
{
    m_server->setSocketOptions(QLocalServer::UserAccessOption);
    if (m_server->listen(socketPath)) {
        LOG_INFO(cwIpc, "Listening on %s", qUtf8Printable(socketPath));
        return true;
    }

    if (m_server->serverError() == QAbstractSocket::AddressInUseError) {
        if (hasLiveListener(socketPath)) {
            const QString err = QStringLiteral("socket in use by a running service: %1")
                                    .arg(socketPath);
            LOG_ERROR(cwIpc, "%s", qUtf8Printable(err));
            emit errorOccurred(err);
            return false;
        }
        LOG_WARN(cwIpc, "Removing stale socket %s", qUtf8Printable(socketPath));
        QLocalServer::removeServer(socketPath);
        if (m_server->listen(socketPath)) {
            LOG_INFO(cwIpc, "Listening on %s", qUtf8Printable(socketPath));
            return true;
        }
    }

    const QString err = m_server->errorString();
    LOG_ERROR(cwIpc, "Failed to listen on %s: %s", qUtf8Printable(socketPath),
              qUtf8Printable(err));
    emit errorOccurred(err);
    return false;
}

void SocketServer::close()
{
    const QList<QLocalSocket*> clients = m_pending.keys();
    m_pending.clear();
    for (QLocalSocket* client : clients) {
        client->disconnect(this);
        client->disconnectFromServer();
        client->deleteLater();
    }
    if (m_server->isListening()) {
        LOG_INFO(cwIpc, "Closing %s", qUtf8Printable(m_server->fullServerName()));
        m_server->close();
    }
}

bool SocketServer::isListening() const
{
    return m_server->isListening();
}

void SocketServer::setRequestHandler(RequestHandler handler)
{
    m_handler = std::move(handler);
}

void SocketServer::onNewConnection()
{
    while (QLocalSocket* client = m_server->nextPendingConnection()) {
        m_pending.insert(client, QByteArray());
        connect(client, &QLocalSocket::readyRead, this, &SocketServer::onReadyRead);
        connect(client, &QLocalSocket::disconnected, this, &SocketServer::onDisconnected);
        LOG_DEBUG(cwIpc, "Client connected (%d open)", clientCount());
        emit clientConnected();
    }
}

void SocketServer::onReadyRead()
{
    auto* client = qobject_cast<QLocalSocket*>(sender());
    if (!client || !m_pending.contains(client)) {
        return;
    }
    QByteArray& buffer = m_pending[client];
    buffer.append(client->readAll());
    if (buffer.size() > kMaxPendingBytes) {
        LOG_WARN(cwIpc, "Client exceeded %d pending bytes; disconnecting", kMaxPendingBytes);
        dropClient(client);
        return;
    }
    drain(client);
}

void SocketServer::onDisconnected()
{
    auto* client = qobject_cast<QLocalSocket*>(sender());
    if (client && m_pending.remove(client) > 0) {
        LOG_DEBUG(cwIpc, "Client disconnected");
        client->deleteLater();
        emit clientDisconnected();
    }
}

void SocketServer::drain(QLocalSocket* client)
{
    while (m_pending.contains(client)) {
        QByteArray& buffer = m_pending[client];
        const IpcMessage::Frame frame = IpcMessage::decode(buffer);
        if (frame.status == IpcMessage::Frame::Status::Incomplete) {
            return;
        }
        if (frame.status == IpcMessage::Frame::Status::Malformed) {
            if (frame.bytesConsumed <= 0) {
                dropClient(client);
                return;
            }
            buffer.remove(0, frame.bytesConsumed);
            continue;
        }
        buffer.remove(0, frame.bytesConsumed);

        const QJsonObject& request = frame.json;
        const qint64 id = IpcMessage::requestId(request);
        if (request.value(QStringLiteral("type")).toString() != QLatin1String("request")) {
            LOG_DEBUG(cwIpc, "Ignoring non-request frame");
            continue;
        }

        const QJsonObject reply = m_handler
            ? m_handler(request)
            : IpcMessage::makeError(id, IpcErrorCode::InternalError,
                                    QStringLiteral("no request handler"));
        const QByteArray encoded = IpcMessage::encode(reply);
        if (encoded.isEmpty()) {
            client->write(IpcMessage::encode(IpcMessage::makeError(
                id, IpcErrorCode::InternalError, QStringLiteral("response too large"))));
        } else {
            client->write(encoded);
        }
        client->flush();
    }
}

void SocketServer::dropClient(QLocalSocket* client)
{
    if (m_pending.remove(client) == 0) {
        return;
    }
    client->disconnect(this);
    client->disconnectFromServer();
    client->deleteLater();
    emit clientDisconnected();
}

} // namespace cw
