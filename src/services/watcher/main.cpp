#include "services/watcher/watcher_service.h"
#include "core/shared/settings_manager.h"

#include <QCoreApplication>

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("codexwatcher-service"));
    app.setApplicationVersion(QStringLiteral("0.1.0"));

    const cw::Settings settings = cw::SettingsManager::resolve();
    cw::WatcherService service(settings);
    return service.run();
}
