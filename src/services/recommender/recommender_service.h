#pragma once

#include "core/feedback/room_category_provider.h"
#include "core/feedback/timer_service.h"
#include "core/ipc/service_base.h"
#include "core/learning/recommendation_engine.h"
#include "core/shared/settings.h"

#include <QJsonObject>
#include <QString>

#include <memory>

namespace tp {

class ActivityLogStore;
class PersistenceGateway;

class RecommenderService : public ServiceBase {
    Q_OBJECT
public:
    // Components left null are built from the settings by initialize().
    struct Components {
        std::unique_ptr<TimerService> timers;
        std::unique_ptr<PersistenceGateway> persistence;
        std::unique_ptr<ActivityLogStore> activityLog;
    };

    explicit RecommenderService(EngineSettings settings, QObject* parent = nullptr);
    RecommenderService(EngineSettings settings, Components components, QObject* parent = nullptr);
    ~RecommenderService() override;

    // Opens storage, restores learning state and wires notifications.
    // Storage failures degrade to an in-memory engine; this only fails when
    // called twice.
    bool initialize();

    RecommendationEngine* engine() const { return m_engine.get(); }

protected:
    QJsonObject handleRequest(const QJsonObject& request) override;
    void onShutdownRequested() override;

private:
    QJsonObject handleGetRecommendation(uint64_t id, const QJsonObject& params);
    QJsonObject handleRecommendationApplied(uint64_t id, const QJsonObject& params);
    QJsonObject handleTemperatureManuallyChanged(uint64_t id, const QJsonObject& params);
    QJsonObject handleEntitySelected(uint64_t id, const QJsonObject& params);
    QJsonObject handleGetStatistics(uint64_t id, const QJsonObject& params);
    QJsonObject handleResetLearningData(uint64_t id, const QJsonObject& params);
    QJsonObject handleGetSystemStatus(uint64_t id);
    QJsonObject handleGetRecentActivity(uint64_t id, const QJsonObject& params);
    QJsonObject handleGetDailyStats(uint64_t id, const QJsonObject& params);

    void openStorage();
    void publishResolution(const WindowResolution& resolution);

    EngineSettings m_settings;
    std::unique_ptr<TimerService> m_timers;
    ConfiguredRoomCategoryProvider m_roomCategories;
    std::unique_ptr<ActivityLogStore> m_activityLog;
    std::unique_ptr<PersistenceGateway> m_persistence;
    std::unique_ptr<RecommendationEngine> m_engine;
};

QJsonObject windowResolutionToJson(const WindowResolution& resolution);

} // namespace tp
