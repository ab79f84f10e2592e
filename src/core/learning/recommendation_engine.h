#pragma once

#include "core/feedback/reward_scheduler.h"
#include "core/learning/learning_state_store.h"
#include "core/learning/policy_engine.h"
#include "core/shared/recommendation.h"
#include "core/shared/settings.h"

#include <QDateTime>
#include <QHash>
#include <QJsonObject>
#include <QString>

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>

namespace tp {

class ActivityLogger;
class PersistenceGateway;
class RoomCategoryProvider;
class TimerService;

// RecommendationEngine -- the single entry point host code talks to.
//
// Wires the learning state, the policy and the delayed-reward scheduler
// together, remembers the last recommendation issued per entity, and pushes
// a snapshot to persistence after every learning change. All collaborators
// are optional except the timer service.
class RecommendationEngine {
public:
    struct Collaborators {
        PersistenceGateway* persistence = nullptr;
        ActivityLogger* activityLogger = nullptr;
        RoomCategoryProvider* roomCategories = nullptr;
    };

    RecommendationEngine(const EngineSettings& settings,
                         TimerService& timers,
                         Collaborators collaborators);
    // Deterministic exploration for tests.
    RecommendationEngine(const EngineSettings& settings,
                         TimerService& timers,
                         Collaborators collaborators,
                         quint32 seed);
    ~RecommendationEngine();

    RecommendationEngine(const RecommendationEngine&) = delete;
    RecommendationEngine& operator=(const RecommendationEngine&) = delete;

    // Restores persisted learning state. A missing or unreadable snapshot
    // leaves a fresh engine; calling it again is a no-op.
    void initialize();
    bool isInitialized() const { return m_initialized.load(); }

    // Never fails: invalid input or an internal error yields the fallback
    // recommendation.
    Recommendation getRecommendation(const QString& entityId,
                                     double outdoorTemp,
                                     double currentTarget,
                                     const std::optional<EfficiencyContext>& efficiency = std::nullopt);

    // Arms a monitoring window for the entity's pending recommendation.
    // Returns false (and logs) when there is nothing pending.
    bool onRecommendationApplied(const QString& entityId,
                                 double recommendedTemp,
                                 const QString& appliedBy,
                                 QString* errorOut = nullptr);

    // Returns true if the change resolved a monitoring window.
    bool onTemperatureManuallyChanged(const QString& entityId,
                                      double newTemp,
                                      double previousTemp,
                                      const QString& changedBy);

    void onEntitySelected(const QString& entityId);

    // Per-entity statistics when entityId is non-empty, aggregate otherwise.
    QJsonObject getStatistics(const QString& entityId = QString()) const;

    // Cancels the affected monitoring windows, then clears learning state,
    // then persists. Empty entityId resets everything. Idempotent.
    void resetLearningData(const QString& entityId = QString());

    QJsonObject systemStatus() const;

    // Observes every monitoring-window resolution, after the reward (if any)
    // has been applied and persistence requested. May be invoked from the
    // timer thread.
    void setResolutionListener(RewardScheduler::ResolutionHandler listener);

    std::optional<Recommendation> pendingRecommendation(const QString& entityId) const;

    const LearningStateStore& learningState() const { return m_store; }
    const RewardScheduler& rewardScheduler() const { return *m_scheduler; }
    const EngineSettings& settings() const { return m_settings; }

private:
    void onWindowResolved(const WindowResolution& resolution);
    void persist(const char* reason);

    static LearningStateStore::Config storeConfig(const EngineSettings& settings);
    static ExplorationSchedule::Config explorationConfig(const EngineSettings& settings);
    static RewardScheduler::Config schedulerConfig(const EngineSettings& settings);

    EngineSettings m_settings;
    Collaborators m_collaborators;

    LearningStateStore m_store;
    PolicyEngine m_policy;

    mutable std::mutex m_mutex;
    QHash<QString, Recommendation> m_pending;
    QString m_lastSelectedEntity;
    QDateTime m_lastSelectedAt;
    RewardScheduler::ResolutionHandler m_listener;

    const QDateTime m_startedAt;
    std::atomic<bool> m_initialized{false};
    std::atomic<uint64_t> m_recommendationsIssued{0};
    std::atomic<uint64_t> m_fallbacksIssued{0};

    // Declared last: destroyed first, so no timer callback outlives the
    // members it touches.
    std::unique_ptr<RewardScheduler> m_scheduler;
};

} // namespace tp
