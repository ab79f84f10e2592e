#include "core/learning/recommendation_engine.h"
#include "core/feedback/activity_logger.h"
#include "core/feedback/room_category_provider.h"
#include "core/feedback/timer_service.h"
#include "core/shared/logging.h"
#include "core/store/persistence_gateway.h"

#include <QJsonArray>

#include <chrono>
#include <cmath>

namespace tp {

namespace {

QJsonObject entityStatisticsToJson(const EntityStatistics& stats)
{
    QJsonObject json;
    json[QStringLiteral("entityId")] = stats.entityId;
    json[QStringLiteral("totalRecommendations")] = stats.totalRecommendations;
    json[QStringLiteral("successfulRecommendations")] = stats.successfulRecommendations;
    json[QStringLiteral("successRate")] = stats.successRate;
    json[QStringLiteral("personalizedBias")] = stats.personalizedBias;
    json[QStringLiteral("exploredStates")] = stats.exploredContexts;
    json[QStringLiteral("currentEpsilon")] = stats.currentEpsilon;
    json[QStringLiteral("lastUpdate")] = stats.lastUpdate.isValid()
        ? QJsonValue(stats.lastUpdate.toString(Qt::ISODateWithMs))
        : QJsonValue();
    return json;
}

} // namespace

RecommendationEngine::RecommendationEngine(const EngineSettings& settings,
                                           TimerService& timers,
                                           Collaborators collaborators)
    : m_settings(settings)
    , m_collaborators(collaborators)
    , m_store(storeConfig(settings), explorationConfig(settings))
    , m_policy(m_store)
    , m_startedAt(QDateTime::currentDateTimeUtc())
    , m_scheduler(std::make_unique<RewardScheduler>(m_store, timers, collaborators.activityLogger,
                                                    schedulerConfig(settings)))
{
    m_scheduler->setResolutionHandler([this](const WindowResolution& resolution) {
        onWindowResolved(resolution);
    });
}

RecommendationEngine::RecommendationEngine(const EngineSettings& settings,
                                           TimerService& timers,
                                           Collaborators collaborators,
                                           quint32 seed)
    : m_settings(settings)
    , m_collaborators(collaborators)
    , m_store(storeConfig(settings), explorationConfig(settings))
    , m_policy(m_store, seed)
    , m_startedAt(QDateTime::currentDateTimeUtc())
    , m_scheduler(std::make_unique<RewardScheduler>(m_store, timers, collaborators.activityLogger,
                                                    schedulerConfig(settings)))
{
    m_scheduler->setResolutionHandler([this](const WindowResolution& resolution) {
        onWindowResolved(resolution);
    });
}

RecommendationEngine::~RecommendationEngine()
{
    // Stop window resolution before the state it writes to goes away.
    m_scheduler.reset();
}

LearningStateStore::Config RecommendationEngine::storeConfig(const EngineSettings& settings)
{
    LearningStateStore::Config config;
    config.learningRate = settings.learningRate;
    config.optimisticInitialValue = settings.optimisticInitialValue;
    config.historyCapacity = settings.historyCapacity;
    return config;
}

ExplorationSchedule::Config RecommendationEngine::explorationConfig(const EngineSettings& settings)
{
    ExplorationSchedule::Config config;
    config.initial = settings.initialEpsilon;
    config.floor = settings.minEpsilon;
    config.decay = settings.epsilonDecay;
    return config;
}

RewardScheduler::Config RecommendationEngine::schedulerConfig(const EngineSettings& settings)
{
    RewardScheduler::Config config;
    config.windowDuration = std::chrono::milliseconds(settings.monitoringWindowMs);
    config.sustainedReward = settings.sustainedReward;
    config.overrideReward = settings.overrideReward;
    return config;
}

void RecommendationEngine::initialize()
{
    if (m_initialized.load()) {
        return;
    }

    if (m_collaborators.persistence) {
        const LearningSnapshot snapshot = m_collaborators.persistence->load();
        if (!snapshot.isEmpty()) {
            m_store.restore(snapshot);
        } else {
            LOG_INFO(tpCore, "No persisted learning state; starting fresh");
        }
    } else {
        LOG_INFO(tpCore, "Persistence disabled; learning state lives in memory only");
    }

    if (!m_collaborators.activityLogger) {
        LOG_WARN(tpCore, "No activity logger configured; activity will not be recorded");
    }

    m_initialized.store(true);
    LOG_INFO(tpCore, "Recommendation engine initialized (%d entities, epsilon %.4f)",
             m_store.entityCount(), m_store.epsilon());
}

Recommendation RecommendationEngine::getRecommendation(const QString& entityId,
                                                       double outdoorTemp,
                                                       double currentTarget,
                                                       const std::optional<EfficiencyContext>& efficiency)
{
    const RoomCategory room = resolveRoomCategory(m_collaborators.roomCategories, entityId);
    Recommendation rec = m_policy.recommend(entityId, outdoorTemp, currentTarget, room, efficiency);

    ++m_recommendationsIssued;
    if (rec.fallback) {
        ++m_fallbacksIssued;
        return rec;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_pending.insert(entityId, rec);
    return rec;
}

bool RecommendationEngine::onRecommendationApplied(const QString& entityId,
                                                   double recommendedTemp,
                                                   const QString& appliedBy,
                                                   QString* errorOut)
{
    std::optional<Recommendation> pending;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_pending.find(entityId);
        if (it != m_pending.end()) {
            pending = it.value();
            m_pending.erase(it);
        }
    }

    if (!pending) {
        LOG_WARN(tpCore, "recommendation-applied for '%s' without a pending recommendation; ignored",
                 qUtf8Printable(entityId));
        if (errorOut) {
            *errorOut = QStringLiteral("No pending recommendation for %1").arg(entityId);
        }
        return false;
    }

    if (std::isfinite(recommendedTemp) && std::abs(recommendedTemp - pending->recommendedTemp) > 0.05) {
        LOG_WARN(tpCore, "Applied temperature %.1f for '%s' differs from recommended %.1f",
                 recommendedTemp, qUtf8Printable(entityId), pending->recommendedTemp);
    }

    if (m_collaborators.activityLogger) {
        RecommendationApplicationRecord record;
        record.entityId = entityId;
        record.recommendedTemp = pending->recommendedTemp;
        record.originalTemp = pending->currentTemp;
        record.appliedBy = appliedBy.isEmpty() ? QStringLiteral("user") : appliedBy;
        record.confidence = pending->confidence;
        record.energySavingsPct = pending->energySavingsPct;
        record.context = pending->context;
        record.reason = pending->reason;
        record.timestamp = QDateTime::currentDateTimeUtc();
        m_collaborators.activityLogger->logRecommendationApplication(record);
    }

    if (!m_scheduler->arm(entityId, *pending)) {
        if (errorOut) {
            *errorOut = QStringLiteral("Could not arm monitoring window for %1").arg(entityId);
        }
        return false;
    }
    return true;
}

bool RecommendationEngine::onTemperatureManuallyChanged(const QString& entityId,
                                                        double newTemp,
                                                        double previousTemp,
                                                        const QString& changedBy)
{
    return m_scheduler->onManualAdjustment(entityId, newTemp, previousTemp, changedBy);
}

void RecommendationEngine::onEntitySelected(const QString& entityId)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_lastSelectedEntity = entityId;
    m_lastSelectedAt = QDateTime::currentDateTimeUtc();
    LOG_DEBUG(tpCore, "Entity selected: '%s'", qUtf8Printable(entityId));
}

QJsonObject RecommendationEngine::getStatistics(const QString& entityId) const
{
    if (!entityId.isEmpty()) {
        const auto stats = m_store.statistics(entityId);
        if (stats) {
            return entityStatisticsToJson(*stats);
        }
        EntityStatistics empty;
        empty.entityId = entityId;
        empty.currentEpsilon = m_store.epsilon();
        return entityStatisticsToJson(empty);
    }

    const AggregateStatistics stats = m_store.aggregateStatistics();
    QJsonObject json;
    json[QStringLiteral("totalEntities")] = stats.entityCount;
    json[QStringLiteral("totalRecommendations")] = stats.totalRecommendations;
    json[QStringLiteral("successfulRecommendations")] = stats.successfulRecommendations;
    json[QStringLiteral("overallSuccessRate")] = stats.successRate;
    json[QStringLiteral("exploredStates")] = stats.exploredContexts;
    json[QStringLiteral("currentEpsilon")] = stats.currentEpsilon;
    json[QStringLiteral("systemUptimeMs")] =
        static_cast<double>(m_startedAt.msecsTo(QDateTime::currentDateTimeUtc()));
    return json;
}

void RecommendationEngine::resetLearningData(const QString& entityId)
{
    if (entityId.isEmpty()) {
        const int cancelled = m_scheduler->cancelAll();
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_pending.clear();
        }
        m_store.resetAll();
        LOG_INFO(tpCore, "Reset all learning data (%d windows cancelled)", cancelled);
    } else {
        const bool cancelled = m_scheduler->cancel(entityId);
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_pending.remove(entityId);
        }
        m_store.reset(entityId);
        LOG_INFO(tpCore, "Reset learning data for '%s'%s", qUtf8Printable(entityId),
                 cancelled ? " (window cancelled)" : "");
    }
    persist("reset");
}

QJsonObject RecommendationEngine::systemStatus() const
{
    QJsonObject json;
    json[QStringLiteral("initialized")] = m_initialized.load();
    json[QStringLiteral("currentEpsilon")] = m_store.epsilon();
    json[QStringLiteral("entityCount")] = m_store.entityCount();
    json[QStringLiteral("activeMonitoringWindows")] = m_scheduler->activeWindowCount();
    json[QStringLiteral("activityLoggerAvailable")] = m_collaborators.activityLogger != nullptr;
    json[QStringLiteral("persistenceAvailable")] = m_collaborators.persistence != nullptr;
    json[QStringLiteral("recommendationsIssued")] = static_cast<double>(m_recommendationsIssued.load());
    json[QStringLiteral("fallbacksIssued")] = static_cast<double>(m_fallbacksIssued.load());
    json[QStringLiteral("uptimeMs")] =
        static_cast<double>(m_startedAt.msecsTo(QDateTime::currentDateTimeUtc()));

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        QJsonArray pending;
        for (auto it = m_pending.cbegin(); it != m_pending.cend(); ++it) {
            pending.append(it.key());
        }
        json[QStringLiteral("pendingRecommendations")] = pending;
        json[QStringLiteral("lastSelectedEntity")] = m_lastSelectedEntity.isEmpty()
            ? QJsonValue()
            : QJsonValue(m_lastSelectedEntity);
    }

    const RewardScheduler::Counters counters = m_scheduler->counters();
    QJsonObject windows;
    windows[QStringLiteral("armed")] = static_cast<double>(counters.armed);
    windows[QStringLiteral("accepted")] = static_cast<double>(counters.accepted);
    windows[QStringLiteral("overridden")] = static_cast<double>(counters.overridden);
    windows[QStringLiteral("superseded")] = static_cast<double>(counters.superseded);
    windows[QStringLiteral("cancelled")] = static_cast<double>(counters.cancelled);
    json[QStringLiteral("monitoringWindows")] = windows;

    if (m_collaborators.persistence) {
        const PersistenceGateway::Stats stats = m_collaborators.persistence->stats();
        QJsonObject persistence;
        persistence[QStringLiteral("saved")] = static_cast<double>(stats.saved);
        persistence[QStringLiteral("failedAttempts")] = static_cast<double>(stats.failedAttempts);
        persistence[QStringLiteral("dropped")] = static_cast<double>(stats.dropped);
        persistence[QStringLiteral("superseded")] = static_cast<double>(stats.superseded);
        persistence[QStringLiteral("evicted")] = static_cast<double>(stats.evicted);
        persistence[QStringLiteral("pending")] = static_cast<int>(stats.pending);
        if (!stats.lastError.isEmpty()) {
            persistence[QStringLiteral("lastError")] = stats.lastError;
        }
        json[QStringLiteral("persistence")] = persistence;
    }
    return json;
}

void RecommendationEngine::setResolutionListener(RewardScheduler::ResolutionHandler listener)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_listener = std::move(listener);
}

std::optional<Recommendation> RecommendationEngine::pendingRecommendation(const QString& entityId) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_pending.constFind(entityId);
    if (it == m_pending.cend()) {
        return std::nullopt;
    }
    return it.value();
}

void RecommendationEngine::onWindowResolved(const WindowResolution& resolution)
{
    if (resolution.rewardApplied) {
        persist("reward");
    }

    RewardScheduler::ResolutionHandler listener;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        listener = m_listener;
    }
    if (listener) {
        listener(resolution);
    }
}

void RecommendationEngine::persist(const char* reason)
{
    if (!m_collaborators.persistence) {
        return;
    }
    if (!m_collaborators.persistence->save(m_store.snapshot())) {
        LOG_WARN(tpCore, "Snapshot after %s was not queued for persistence", reason);
    }
}

} // namespace tp
