#pragma once

#include "core/index/index_store.h"
#include "core/indexing/poll_scheduler.h"
#include "core/ipc/service_base.h"
#include "core/query/search_executor.h"
#include "core/shared/settings.h"

#include <QThread>

#include <memory>

namespace cw {

// WatcherService -- owns the Index Store, polls the transcript roots on a
// dedicated thread and serves reads, searches and mutations over IPC.
class WatcherService : public ServiceBase {
    Q_OBJECT
public:
    explicit WatcherService(const Settings& settings, QObject* parent = nullptr);
    ~WatcherService() override;

    IndexStore& store() { return *m_store; }
    const Settings& settings() const { return m_settings; }

    void startPolling();
    void stopPolling();
    bool isPolling() const { return m_pollThread.isRunning(); }

protected:
    void onStarted() override;

private:
    QJsonObject handleGetSessions(qint64 id);
    QJsonObject handleGetMessages(qint64 id, const QJsonObject& params);
    QJsonObject handleGetStats(qint64 id);
    QJsonObject handleReindex(qint64 id);
    QJsonObject handleSearch(qint64 id, const QJsonObject& params);
    QJsonObject handleDeleteSession(qint64 id, const QJsonObject& params);
    QJsonObject handleDeleteMessage(qint64 id, const QJsonObject& params);
    QJsonObject handleUpdateSessionTitle(qint64 id, const QJsonObject& params);

    static QJsonObject mutationError(qint64 id, const MutationResult& result);

    Settings m_settings;
    std::unique_ptr<IndexStore> m_store;
    SearchExecutor m_executor;
    QThread m_pollThread;
    std::unique_ptr<PollScheduler> m_scheduler;
};

} // namespace cw
