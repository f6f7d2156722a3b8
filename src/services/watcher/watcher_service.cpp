#include "services/watcher/watcher_service.h"
#include "core/ipc/message.h"
#include "core/query/query_parser.h"
#include "core/shared/logging.h"
#include "core/shared/search_result.h"

#include <QJsonArray>

namespace cw {

namespace {

QString requiredString(const QJsonObject& params, const char* key)
{
    return params.value(QLatin1String(key)).toString().trimmed();
}

} // namespace

WatcherService::WatcherService(const Settings& settings, QObject* parent)
    : ServiceBase(settings.serviceName, parent)
    , m_settings(settings)
    , m_store(std::make_unique<IndexStore>(settings))
    , m_executor(SearchLimits{settings.searchMaxReturn, settings.searchBudgetMs})
{
    m_pollThread.setObjectName(QStringLiteral("codexwatcher-poll"));

    registerMethod(QStringLiteral("getSessions"), [this](qint64 id, const QJsonObject&) {
        return handleGetSessions(id);
    });
    registerMethod(QStringLiteral("getMessages"), [this](qint64 id, const QJsonObject& params) {
        return handleGetMessages(id, params);
    });
    registerMethod(QStringLiteral("getStats"), [this](qint64 id, const QJsonObject&) {
        return handleGetStats(id);
    });
    registerMethod(QStringLiteral("reindex"), [this](qint64 id, const QJsonObject&) {
        return handleReindex(id);
    });
    registerMethod(QStringLiteral("search"), [this](qint64 id, const QJsonObject& params) {
        return handleSearch(id, params);
    });
    registerMethod(QStringLiteral("deleteSession"), [this](qint64 id, const QJsonObject& params) {
        return handleDeleteSession(id, params);
    });
    registerMethod(QStringLiteral("deleteMessage"), [this](qint64 id, const QJsonObject& params) {
        return handleDeleteMessage(id, params);
    });
    registerMethod(QStringLiteral("updateSessionTitle"),
                   [this](qint64 id, const QJsonObject& params) {
                       return handleUpdateSessionTitle(id, params);
                   });
}

WatcherService::~WatcherService()
{
    stopPolling();
}

void WatcherService::onStarted()
{
    startPolling();
}

void WatcherService::startPolling()
{
    if (m_pollThread.isRunning()) {
        return;
    }
    IndexStore* store = m_store.get();
    m_scheduler = std::make_unique<PollScheduler>([store]() { return store->scanOnce(); },
                                                  m_settings.pollIntervalMs);
    m_scheduler->moveToThread(&m_pollThread);
    m_pollThread.start();
    QMetaObject::invokeMethod(m_scheduler.get(), &PollScheduler::start, Qt::QueuedConnection);
    LOG_INFO(cwCore, "Watching codex=%s claude=%s", qUtf8Printable(m_settings.codexDir),
             qUtf8Printable(m_settings.claudeDir));
}

void WatcherService::stopPolling()
{
    if (!m_pollThread.isRunning()) {
        return;
    }
    // Blocks until any cycle already running on the poll thread finishes.
    QMetaObject::invokeMethod(m_scheduler.get(), &PollScheduler::stop,
                              Qt::BlockingQueuedConnection);
    m_pollThread.quit();
    m_pollThread.wait();
    m_scheduler.reset();
}

QJsonObject WatcherService::handleGetSessions(qint64 id)
{
    QJsonArray sessions;
    for (const Session& session : m_store->sessions()) {
        sessions.append(sessionToJson(session));
    }
    QJsonObject result;
    result.insert(QStringLiteral("sessions"), sessions);
    return IpcMessage::makeResponse(id, result);
}

QJsonObject WatcherService::handleGetMessages(qint64 id, const QJsonObject& params)
{
    const QString sessionId = requiredString(params, "sessionId");
    if (sessionId.isEmpty()) {
        return IpcMessage::makeError(id, IpcErrorCode::InvalidParams,
                                     QStringLiteral("Missing 'sessionId'"));
    }
    if (!m_store->hasSession(sessionId)) {
        return IpcMessage::makeError(id, IpcErrorCode::NotFound,
                                     QStringLiteral("session not found: %1").arg(sessionId));
    }

    const int limit = params.value(QStringLiteral("limit")).toInt(0);
    QJsonArray messages;
    for (const Message& message : m_store->messages(sessionId, limit)) {
        messages.append(messageToJson(message));
    }
    QJsonObject result;
    result.insert(QStringLiteral("messages"), messages);
    return IpcMessage::makeResponse(id, result);
}

QJsonObject WatcherService::handleGetStats(qint64 id)
{
    return IpcMessage::makeResponse(id, indexStatsToJson(m_store->stats()));
}

QJsonObject WatcherService::handleReindex(qint64 id)
{
    m_store->reindex();
    QJsonObject result;
    result.insert(QStringLiteral("reindexed"), true);
    result.insert(QStringLiteral("stats"), indexStatsToJson(m_store->stats()));
    return IpcMessage::makeResponse(id, result);
}

QJsonObject WatcherService::handleSearch(qint64 id, const QJsonObject& params)
{
    const QJsonValue queryValue = params.value(QStringLiteral("query"));
    if (!queryValue.isUndefined() && !queryValue.isString()) {
        return IpcMessage::makeError(id, IpcErrorCode::InvalidParams,
                                     QStringLiteral("'query' must be a string"));
    }

    const CompiledQuery query = QueryParser::parse(
        queryValue.toString(), params.value(QStringLiteral("scope")).toString());
    const SearchResponse response = m_executor.exec(
        *m_store, query,
        params.value(QStringLiteral("limit")).toInt(0),
        params.value(QStringLiteral("offset")).toInt(0));
    return IpcMessage::makeResponse(id, searchResponseToJson(response));
}

QJsonObject WatcherService::handleDeleteSession(qint64 id, const QJsonObject& params)
{
    const QString sessionId = requiredString(params, "sessionId");
    if (sessionId.isEmpty()) {
        return IpcMessage::makeError(id, IpcErrorCode::InvalidParams,
                                     QStringLiteral("Missing 'sessionId'"));
    }
    const MutationResult outcome = m_store->deleteSession(sessionId);
    if (!outcome.ok()) {
        return mutationError(id, outcome);
    }
    QJsonObject result;
    result.insert(QStringLiteral("deleted"), true);
    result.insert(QStringLiteral("sessionId"), sessionId);
    return IpcMessage::makeResponse(id, result);
}

QJsonObject WatcherService::handleDeleteMessage(qint64 id, const QJsonObject& params)
{
    const QString sessionId = requiredString(params, "sessionId");
    const QString messageId = requiredString(params, "messageId");
    if (sessionId.isEmpty() || messageId.isEmpty()) {
        return IpcMessage::makeError(id, IpcErrorCode::InvalidParams,
                                     QStringLiteral("Missing 'sessionId' or 'messageId'"));
    }
    const MutationResult outcome = m_store->deleteMessage(sessionId, messageId);
    if (!outcome.ok()) {
        return mutationError(id, outcome);
    }
    QJsonObject result;
    result.insert(QStringLiteral("deleted"), true);
    result.insert(QStringLiteral("sessionId"), sessionId);
    result.insert(QStringLiteral("messageId"), messageId);
    return IpcMessage::makeResponse(id, result);
}

QJsonObject WatcherService::handleUpdateSessionTitle(qint64 id, const QJsonObject& params)
{
    const QString sessionId = requiredString(params, "sessionId");
    const QString title = requiredString(params, "title");
    if (sessionId.isEmpty() || title.isEmpty()) {
        return IpcMessage::makeError(id, IpcErrorCode::InvalidParams,
                                     QStringLiteral("Missing 'sessionId' or 'title'"));
    }
    const MutationResult outcome = m_store->updateSessionTitle(sessionId, title);
    if (!outcome.ok()) {
        return mutationError(id, outcome);
    }
    QJsonObject result;
    const std::optional<Session> session = m_store->session(sessionId);
    if (session.has_value()) {
        result.insert(QStringLiteral("session"), sessionToJson(session.value()));
    }
    return IpcMessage::makeResponse(id, result);
}

QJsonObject WatcherService::mutationError(qint64 id, const MutationResult& result)
{
    switch (result.status) {
    case MutationResult::Status::NotFound:
        return IpcMessage::makeError(id, IpcErrorCode::NotFound, result.error);
    case MutationResult::Status::InvalidArgument:
        return IpcMessage::makeError(id, IpcErrorCode::InvalidParams, result.error);
    case MutationResult::Status::Ok:
    case MutationResult::Status::IoError:
        break;
    }
    return IpcMessage::makeError(id, IpcErrorCode::InternalError, result.error);
}

} // namespace cw
