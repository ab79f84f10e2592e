#include "recommender_service.h"
#include "core/shared/logging.h"
#include "core/shared/settings_manager.h"

#include <QCoreApplication>

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("thermopilot-recommender"));
    app.setApplicationVersion(QStringLiteral("0.1.0"));

    tp::EngineSettings settings = tp::SettingsManager::load().value_or(tp::EngineSettings());
    if (settings.dbPath.isEmpty()) {
        settings.dbPath = tp::SettingsManager::defaultDbPath();
    }

    tp::RecommenderService service(settings);
    if (!service.initialize()) {
        LOG_ERROR(tpCore, "Recommender service failed to initialize");
        return 1;
    }
    return service.run();
}
