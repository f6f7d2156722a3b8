#include "core/ipc/service_base.h"
#include "core/ipc/message.h"
#include "core/shared/logging.h"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFileInfo>

#include <unistd.h>

#include <cstdio>

namespace cw {

ServiceBase::ServiceBase(const QString& serviceName, QObject* parent)
    : QObject(parent)
    , m_serviceName(serviceName)
    , m_server(std::make_unique<SocketServer>(this))
{
    m_server->setRequestHandler([this](const QJsonObject& request) {
        return handleRequest(request);
    });
    registerMethod(QStringLiteral("ping"), [this](qint64 id, const QJsonObject&) {
        return handlePing(id);
    });
    registerMethod(QStringLiteral("shutdown"), [this](qint64 id, const QJsonObject&) {
        return handleShutdown(id);
    });
}

ServiceBase::~ServiceBase() = default;

int ServiceBase::run()
{
    const QString path = socketPath(m_serviceName);
    const QString dir = QFileInfo(path).absolutePath();
    if (!QDir().mkpath(dir)) {
        LOG_ERROR(cwIpc, "Failed to create runtime directory: %s", qUtf8Printable(dir));
        return 1;
    }
    if (!m_server->listen(path)) {
        LOG_ERROR(cwIpc, "Service '%s' failed to start", qUtf8Printable(m_serviceName));
        return 1;
    }

    onStarted();
    LOG_INFO(cwIpc, "Service '%s' ready on %s", qUtf8Printable(m_serviceName),
             qUtf8Printable(path));

    // Readiness line for whoever launched us.
    std::fprintf(stdout, "ready\n");
    std::fflush(stdout);

    return QCoreApplication::exec();
}

QString ServiceBase::runtimeDirectory()
{
    const QString overrideDir = qEnvironmentVariable("CODEXWATCHER_RUNTIME_DIR").trimmed();
    if (!overrideDir.isEmpty()) {
        return QDir::cleanPath(overrideDir);
    }
    return QStringLiteral("/tmp/codexwatcher-%1").arg(static_cast<qulonglong>(::getuid()));
}

QString ServiceBase::socketPath(const QString& serviceName)
{
    return QDir(runtimeDirectory()).filePath(serviceName + QStringLiteral(".sock"));
}

void ServiceBase::registerMethod(const QString& method, MethodHandler handler)
{
    m_methods.insert(method, std::move(handler));
}

QJsonObject ServiceBase::handleRequest(const QJsonObject& request)
{
    const QString method = request.value(QStringLiteral("method")).toString();
    const qint64 id = IpcMessage::requestId(request);

    const auto it = m_methods.constFind(method);
    if (it == m_methods.cend()) {
        LOG_WARN(cwIpc, "Unknown method '%s'", qUtf8Printable(method));
        return IpcMessage::makeError(id, IpcErrorCode::NotFound,
                                     QStringLiteral("Unknown method: %1").arg(method));
    }
    return it.value()(id, request.value(QStringLiteral("params")).toObject());
}

QJsonObject ServiceBase::handlePing(qint64 id)
{
    QJsonObject result;
    result.insert(QStringLiteral("pong"), true);
    result.insert(QStringLiteral("service"), m_serviceName);
    result.insert(QStringLiteral("timestamp"), QDateTime::currentMSecsSinceEpoch());
    return IpcMessage::makeResponse(id, result);
}

QJsonObject ServiceBase::handleShutdown(qint64 id)
{
    LOG_INFO(cwIpc, "Shutdown requested for '%s'", qUtf8Printable(m_serviceName));
    // Quit after the response has been written.
    QMetaObject::invokeMethod(QCoreApplication::instance(), &QCoreApplication::quit,
                              Qt::QueuedConnection);

    QJsonObject result;
    result.insert(QStringLiteral("shutting_down"), true);
    return IpcMessage::makeResponse(id, result);
}

} // namespace cw
