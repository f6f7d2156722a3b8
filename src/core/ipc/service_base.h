#pragma once

#include "core/ipc/socket_server.h"
#include "core/shared/ipc_messages.h"

#include <QHash>
#include <QJsonObject>
#include <QObject>
#include <QString>

#include <functional>
#include <memory>

namespace cw {

// ServiceBase -- a QCoreApplication service answering requests on
// <runtime dir>/<serviceName>.sock. Subclasses register their methods;
// ping and shutdown are built in.
class ServiceBase : public QObject {
    Q_OBJECT
public:
    using MethodHandler = std::function<QJsonObject(qint64 id, const QJsonObject& params)>;

    explicit ServiceBase(const QString& serviceName, QObject* parent = nullptr);
    ~ServiceBase() override;

    // Listen and enter the event loop; returns the process exit code.
    int run();

    const QString& serviceName() const { return m_serviceName; }

    // CODEXWATCHER_RUNTIME_DIR, else /tmp/codexwatcher-<uid>.
    static QString runtimeDirectory();
    static QString socketPath(const QString& serviceName);

protected:
    void registerMethod(const QString& method, MethodHandler handler);

    // Dispatches to a registered method; unknown methods get NOT_FOUND.
    virtual QJsonObject handleRequest(const QJsonObject& request);

    // Called on the service thread right before the event loop starts.
    virtual void onStarted() {}

    QJsonObject handlePing(qint64 id);
    QJsonObject handleShutdown(qint64 id);

    QString m_serviceName;
    std::unique_ptr<SocketServer> m_server;

private:
    QHash<QString, MethodHandler> m_methods;
};

} // namespace cw
