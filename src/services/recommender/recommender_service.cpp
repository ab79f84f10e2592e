#include "recommender_service.h"
#include "core/feedback/deadline_timer_service.h"
#include "core/ipc/message.h"
#include "core/shared/logging.h"
#include "core/store/activity_log_store.h"
#include "core/store/persistence_gateway.h"
#include "core/store/sqlite_snapshot_store.h"

#include <QDate>
#include <QDateTime>
#include <QJsonArray>
#include <QPointer>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <optional>

namespace tp {

namespace {

constexpr const char* kServiceName = "recommender";
constexpr int kDefaultActivityLimit = 50;
constexpr int kMaxActivityLimit = 500;

QString readEntityId(const QJsonObject& params)
{
    return params.value(QStringLiteral("entityId")).toString().trimmed();
}

std::optional<double> readNumber(const QJsonObject& params, const QString& key)
{
    const QJsonValue value = params.value(key);
    if (!value.isDouble() || !std::isfinite(value.toDouble())) {
        return std::nullopt;
    }
    return value.toDouble();
}

std::optional<EfficiencyContext> readEfficiency(const QJsonObject& params)
{
    const QJsonValue value = params.value(QStringLiteral("efficiency"));
    if (!value.isObject()) {
        return std::nullopt;
    }
    const QJsonObject obj = value.toObject();
    EfficiencyContext efficiency;
    efficiency.unitType = obj.value(QStringLiteral("unitType")).toString();
    efficiency.currentPowerW = obj.value(QStringLiteral("currentPowerW")).toDouble(0.0);
    efficiency.hourOfDay = obj.value(QStringLiteral("hourOfDay")).toInt(-1);
    return efficiency;
}

QJsonObject invalidParams(uint64_t id, const QString& message)
{
    return IpcMessage::makeError(id, IpcErrorCode::InvalidParams, message);
}

} // namespace

QJsonObject windowResolutionToJson(const WindowResolution& resolution)
{
    QJsonObject json;
    json[QStringLiteral("entityId")] = resolution.entityId;
    json[QStringLiteral("windowId")] = static_cast<qint64>(resolution.windowId);
    json[QStringLiteral("outcome")] = windowStateToString(resolution.outcome);
    json[QStringLiteral("superseded")] = resolution.superseded;
    json[QStringLiteral("rewardApplied")] = resolution.rewardApplied;
    if (resolution.rewardApplied) {
        json[QStringLiteral("reward")] = resolution.reward;
        json[QStringLiteral("previousQ")] = resolution.previousQ;
        json[QStringLiteral("newQ")] = resolution.newQ;
    }
    json[QStringLiteral("elapsedMs")] = static_cast<qint64>(resolution.elapsedMs);
    json[QStringLiteral("recommendation")] = resolution.recommendation.toJson();
    return json;
}

RecommenderService::RecommenderService(EngineSettings settings, QObject* parent)
    : RecommenderService(std::move(settings), Components(), parent)
{
}

RecommenderService::RecommenderService(EngineSettings settings, Components components, QObject* parent)
    : ServiceBase(QString::fromLatin1(kServiceName), parent)
    , m_settings(std::move(settings))
    , m_timers(std::move(components.timers))
    , m_roomCategories(m_settings.roomCategories, m_settings.defaultRoomCategory)
    , m_activityLog(std::move(components.activityLog))
    , m_persistence(std::move(components.persistence))
{
}

RecommenderService::~RecommenderService()
{
    // The engine owns the reward scheduler, whose callbacks reach into the
    // activity log and persistence; tear it down before them.
    m_engine.reset();
    if (m_persistence) {
        m_persistence->shutdown();
    }
}

bool RecommenderService::initialize()
{
    if (m_engine) {
        LOG_WARN(tpCore, "Recommender service already initialized");
        return false;
    }

    if (!m_timers) {
        m_timers = std::make_unique<DeadlineTimerService>();
    }
    openStorage();

    RecommendationEngine::Collaborators collaborators;
    collaborators.persistence = m_persistence.get();
    collaborators.activityLogger = m_activityLog.get();
    collaborators.roomCategories = &m_roomCategories;

    m_engine = std::make_unique<RecommendationEngine>(m_settings, *m_timers, collaborators);

    // Resolutions arrive on the timer thread; hop to ours before touching
    // sockets.
    QPointer<RecommenderService> self(this);
    m_engine->setResolutionListener([self](const WindowResolution& resolution) {
        if (!self) {
            return;
        }
        QMetaObject::invokeMethod(self.data(), [self, resolution]() {
            if (self) {
                self->publishResolution(resolution);
            }
        }, Qt::QueuedConnection);
    });

    m_engine->initialize();
    return true;
}

void RecommenderService::openStorage()
{
    if (m_settings.dbPath.isEmpty()) {
        LOG_WARN(tpCore, "No database path configured; learning state will not be persisted");
        return;
    }

    if (!m_persistence) {
        QString error;
        auto store = SqliteSnapshotStore::open(m_settings.dbPath, &error);
        if (store) {
            PersistenceGateway::RetryPolicy policy;
            policy.maxAttempts = m_settings.maxSaveAttempts;
            policy.initialBackoff = std::chrono::milliseconds(m_settings.initialSaveBackoffMs);
            policy.maxBackoff = std::chrono::milliseconds(m_settings.maxSaveBackoffMs);
            m_persistence = std::make_unique<PersistenceGateway>(std::move(store), policy);
        } else {
            LOG_WARN(tpCore, "Learning database unavailable (%s); running in memory",
                     qUtf8Printable(error));
        }
    }

    if (!m_activityLog && m_settings.activityLogEnabled) {
        QString error;
        m_activityLog = ActivityLogStore::open(m_settings.dbPath, &error);
        if (!m_activityLog) {
            LOG_WARN(tpCore, "Activity log unavailable (%s)", qUtf8Printable(error));
        }
    }

    if (m_activityLog && !m_activityLog->cleanup(m_settings.activityRetentionDays)) {
        LOG_WARN(tpCore, "Activity log cleanup failed");
    }
}

void RecommenderService::publishResolution(const WindowResolution& resolution)
{
    sendNotification(QString::fromLatin1(ipc_method::kMonitoringWindowResolved),
                     windowResolutionToJson(resolution));
}

void RecommenderService::onShutdownRequested()
{
    if (m_persistence && !m_persistence->flush(std::chrono::seconds(5))) {
        LOG_WARN(tpCore, "Pending snapshots not flushed before shutdown");
    }
}

QJsonObject RecommenderService::handleRequest(const QJsonObject& request)
{
    const QString method = request.value(QStringLiteral("method")).toString();
    const uint64_t id = IpcMessage::requestId(request);
    const QJsonObject params = request.value(QStringLiteral("params")).toObject();

    if (!m_engine) {
        if (method == QLatin1String(ipc_method::kPing) || method == QLatin1String(ipc_method::kShutdown)) {
            return ServiceBase::handleRequest(request);
        }
        return IpcMessage::makeError(id, IpcErrorCode::ServiceUnavailable,
                                     QStringLiteral("Recommendation engine is not initialized"));
    }

    if (method == QLatin1String(ipc_method::kGetRecommendation))          return handleGetRecommendation(id, params);
    if (method == QLatin1String(ipc_method::kRecommendationApplied))      return handleRecommendationApplied(id, params);
    if (method == QLatin1String(ipc_method::kTemperatureManuallyChanged)) return handleTemperatureManuallyChanged(id, params);
    if (method == QLatin1String(ipc_method::kEntitySelected))             return handleEntitySelected(id, params);
    if (method == QLatin1String(ipc_method::kGetStatistics))              return handleGetStatistics(id, params);
    if (method == QLatin1String(ipc_method::kResetLearningData))          return handleResetLearningData(id, params);
    if (method == QLatin1String(ipc_method::kGetSystemStatus))            return handleGetSystemStatus(id);
    if (method == QLatin1String(ipc_method::kGetRecentActivity))          return handleGetRecentActivity(id, params);
    if (method == QLatin1String(ipc_method::kGetDailyStats))              return handleGetDailyStats(id, params);

    return ServiceBase::handleRequest(request);
}

QJsonObject RecommenderService::handleGetRecommendation(uint64_t id, const QJsonObject& params)
{
    const QString entityId = readEntityId(params);
    if (entityId.isEmpty()) {
        return invalidParams(id, QStringLiteral("Missing 'entityId' parameter"));
    }
    const auto outdoor = readNumber(params, QStringLiteral("outdoorTemp"));
    if (!outdoor) {
        return invalidParams(id, QStringLiteral("Missing or invalid 'outdoorTemp'"));
    }
    const auto target = readNumber(params, QStringLiteral("currentTarget"));
    if (!target) {
        return invalidParams(id, QStringLiteral("Missing or invalid 'currentTarget'"));
    }

    const Recommendation rec = m_engine->getRecommendation(entityId, *outdoor, *target,
                                                           readEfficiency(params));
    return IpcMessage::makeResponse(id, rec.toJson());
}

QJsonObject RecommenderService::handleRecommendationApplied(uint64_t id, const QJsonObject& params)
{
    const QString entityId = readEntityId(params);
    if (entityId.isEmpty()) {
        return invalidParams(id, QStringLiteral("Missing 'entityId' parameter"));
    }
    const auto recommendedTemp = readNumber(params, QStringLiteral("recommendedTemp"));
    if (!recommendedTemp) {
        return invalidParams(id, QStringLiteral("Missing or invalid 'recommendedTemp'"));
    }
    const QString appliedBy = params.value(QStringLiteral("appliedBy")).toString(QStringLiteral("user"));

    QString error;
    if (!m_engine->onRecommendationApplied(entityId, *recommendedTemp, appliedBy, &error)) {
        return IpcMessage::makeError(id, IpcErrorCode::PreconditionFailed, error);
    }

    QJsonObject result;
    result[QStringLiteral("entityId")] = entityId;
    result[QStringLiteral("monitoring")] = true;
    result[QStringLiteral("windowMs")] = static_cast<qint64>(m_settings.monitoringWindowMs);
    return IpcMessage::makeResponse(id, result);
}

QJsonObject RecommenderService::handleTemperatureManuallyChanged(uint64_t id, const QJsonObject& params)
{
    const QString entityId = readEntityId(params);
    if (entityId.isEmpty()) {
        return invalidParams(id, QStringLiteral("Missing 'entityId' parameter"));
    }
    const auto newTemp = readNumber(params, QStringLiteral("newTemp"));
    const auto previousTemp = readNumber(params, QStringLiteral("previousTemp"));
    if (!newTemp || !previousTemp) {
        return invalidParams(id, QStringLiteral("Missing or invalid 'newTemp'/'previousTemp'"));
    }
    const QString changedBy = params.value(QStringLiteral("changedBy")).toString(QStringLiteral("user"));

    QJsonObject result;
    result[QStringLiteral("entityId")] = entityId;
    result[QStringLiteral("resolvedWindow")] =
        m_engine->onTemperatureManuallyChanged(entityId, *newTemp, *previousTemp, changedBy);
    return IpcMessage::makeResponse(id, result);
}

QJsonObject RecommenderService::handleEntitySelected(uint64_t id, const QJsonObject& params)
{
    const QString entityId = readEntityId(params);
    if (entityId.isEmpty()) {
        return invalidParams(id, QStringLiteral("Missing 'entityId' parameter"));
    }
    m_engine->onEntitySelected(entityId);

    QJsonObject result;
    result[QStringLiteral("entityId")] = entityId;
    return IpcMessage::makeResponse(id, result);
}

QJsonObject RecommenderService::handleGetStatistics(uint64_t id, const QJsonObject& params)
{
    return IpcMessage::makeResponse(id, m_engine->getStatistics(readEntityId(params)));
}

QJsonObject RecommenderService::handleResetLearningData(uint64_t id, const QJsonObject& params)
{
    const QString entityId = readEntityId(params);
    m_engine->resetLearningData(entityId);

    QJsonObject result;
    result[QStringLiteral("reset")] = true;
    result[QStringLiteral("scope")] = entityId.isEmpty() ? QStringLiteral("all") : entityId;
    return IpcMessage::makeResponse(id, result);
}

QJsonObject RecommenderService::handleGetSystemStatus(uint64_t id)
{
    QJsonObject status = m_engine->systemStatus();
    status[QStringLiteral("service")] = m_serviceName;
    status[QStringLiteral("clients")] = m_server->clientCount();
    return IpcMessage::makeResponse(id, status);
}

QJsonObject RecommenderService::handleGetRecentActivity(uint64_t id, const QJsonObject& params)
{
    if (!m_activityLog) {
        return IpcMessage::makeError(id, IpcErrorCode::ServiceUnavailable,
                                     QStringLiteral("Activity log is not available"));
    }
    const int limit = std::clamp(params.value(QStringLiteral("limit")).toInt(kDefaultActivityLimit),
                                 1, kMaxActivityLimit);

    QJsonObject result;
    result[QStringLiteral("activity")] = m_activityLog->recentActivity(readEntityId(params), limit);
    return IpcMessage::makeResponse(id, result);
}

QJsonObject RecommenderService::handleGetDailyStats(uint64_t id, const QJsonObject& params)
{
    if (!m_activityLog) {
        return IpcMessage::makeError(id, IpcErrorCode::ServiceUnavailable,
                                     QStringLiteral("Activity log is not available"));
    }
    const QString entityId = readEntityId(params);
    if (entityId.isEmpty()) {
        return invalidParams(id, QStringLiteral("Missing 'entityId' parameter"));
    }

    QDate day = QDateTime::currentDateTimeUtc().date();
    const QString dateParam = params.value(QStringLiteral("date")).toString();  // UTC day
    if (!dateParam.isEmpty()) {
        day = QDate::fromString(dateParam, Qt::ISODate);
        if (!day.isValid()) {
            return invalidParams(id, QStringLiteral("Invalid 'date' (expected yyyy-MM-dd)"));
        }
    }

    const auto stats = m_activityLog->dailyStats(entityId, day);
    if (!stats) {
        return IpcMessage::makeError(id, IpcErrorCode::NotFound,
                                     QStringLiteral("No activity for %1 on %2")
                                         .arg(entityId, day.toString(Qt::ISODate)));
    }
    return IpcMessage::makeResponse(id, stats->toJson());
}

} // namespace tp
