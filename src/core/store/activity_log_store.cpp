#include "core/store/activity_log_store.h"
#include "core/shared/logging.h"

#include <QJsonDocument>

#include <algorithm>
#include <cmath>

#include <sqlite3.h>

namespace tp {

namespace {

constexpr int64_t kMonitoringPeriodMs = 60LL * 60LL * 1000LL;

QDateTime normalizedTimestamp(const QDateTime& dt)
{
    return dt.isValid() ? dt.toUTC() : QDateTime::currentDateTimeUtc();
}

QString toDbTimestamp(const QDateTime& dt)
{
    return normalizedTimestamp(dt).toString(Qt::ISODateWithMs);
}

QString toDbDay(const QDateTime& dt)
{
    return normalizedTimestamp(dt).date().toString(Qt::ISODate);
}

} // namespace

double DailyStats::averageConfidence() const
{
    return recommendationsApplied > 0 ? totalConfidenceSum / recommendationsApplied : 0.0;
}

double DailyStats::successRate() const
{
    if (recommendationsApplied <= 0) {
        return 0.0;
    }
    const double rate = static_cast<double>(recommendationsApplied - adjustmentsMade)
                        / static_cast<double>(recommendationsApplied);
    return std::max(0.0, rate);
}

QJsonObject DailyStats::toJson() const
{
    QJsonObject json;
    json[QStringLiteral("entityId")] = entityId;
    json[QStringLiteral("date")] = day.toString(Qt::ISODate);
    json[QStringLiteral("recommendationsApplied")] = recommendationsApplied;
    json[QStringLiteral("adjustmentsMade")] = adjustmentsMade;
    json[QStringLiteral("successfulRecommendations")] = successfulRecommendations;
    json[QStringLiteral("energySaved")] = energySaved;
    json[QStringLiteral("totalConfidenceSum")] = totalConfidenceSum;
    json[QStringLiteral("avgConfidence")] = averageConfidence();
    json[QStringLiteral("successRate")] = successRate();
    return json;
}

std::unique_ptr<ActivityLogStore> ActivityLogStore::open(const QString& dbPath, QString* errorOut)
{
    auto db = LearningDatabase::open(dbPath, errorOut);
    if (!db) {
        return nullptr;
    }
    return std::make_unique<ActivityLogStore>(std::move(*db));
}

ActivityLogStore::ActivityLogStore(LearningDatabase db)
    : m_db(std::move(db))
{
}

QString ActivityLogStore::adjustmentDirection(double previousTemp, double newTemp)
{
    if (newTemp > previousTemp) {
        return QStringLiteral("increase");
    }
    if (newTemp < previousTemp) {
        return QStringLiteral("decrease");
    }
    return QStringLiteral("maintain");
}

void ActivityLogStore::logRecommendationApplication(const RecommendationApplicationRecord& record)
{
    QJsonObject payload;
    payload[QStringLiteral("originalTemp")] = record.originalTemp;
    payload[QStringLiteral("recommendedTemp")] = record.recommendedTemp;
    payload[QStringLiteral("appliedBy")] = record.appliedBy.isEmpty() ? QStringLiteral("user")
                                                                      : record.appliedBy;
    payload[QStringLiteral("confidence")] = record.confidence;
    payload[QStringLiteral("energySavings")] = record.energySavingsPct;
    payload[QStringLiteral("context")] = contextKeyToJson(record.context);
    payload[QStringLiteral("explorationReason")] = explorationReasonToString(record.reason);

    std::lock_guard<std::mutex> lock(m_mutex);
    if (!recordEvent(kRecommendationApplied, record.entityId, record.timestamp, payload)) {
        return;
    }
    DailyDelta delta;
    delta.applied = 1;
    delta.confidence = record.confidence;
    delta.energySaved = record.energySavingsPct;
    bumpDailyStats(record.entityId, record.timestamp, delta);
    LOG_DEBUG(tpStore, "Recommendation application logged for '%s'", qUtf8Printable(record.entityId));
}

void ActivityLogStore::logManualAdjustment(const ManualAdjustmentRecord& record)
{
    QJsonObject payload;
    payload[QStringLiteral("recommendedTemp")] = record.recommendedTemp;
    payload[QStringLiteral("previousTemp")] = record.previousTemp;
    payload[QStringLiteral("newTemp")] = record.adjustedTemp;
    payload[QStringLiteral("adjustmentTimeMs")] = static_cast<double>(record.adjustmentTimeMs);
    payload[QStringLiteral("changedBy")] = record.changedBy.isEmpty() ? QStringLiteral("user")
                                                                      : record.changedBy;
    payload[QStringLiteral("context")] = contextKeyToJson(record.context);
    payload[QStringLiteral("adjustmentDirection")] = adjustmentDirection(record.previousTemp,
                                                                         record.adjustedTemp);
    payload[QStringLiteral("adjustmentMagnitude")] = std::abs(record.adjustedTemp - record.previousTemp);
    payload[QStringLiteral("withinMonitoringPeriod")] = record.adjustmentTimeMs < kMonitoringPeriodMs;

    std::lock_guard<std::mutex> lock(m_mutex);
    if (!recordEvent(kManualAdjustment, record.entityId, record.timestamp, payload)) {
        return;
    }
    DailyDelta delta;
    delta.adjustments = 1;
    bumpDailyStats(record.entityId, record.timestamp, delta);
    LOG_DEBUG(tpStore, "Manual adjustment logged for '%s'", qUtf8Printable(record.entityId));
}

void ActivityLogStore::logSuccessfulRecommendation(const SuccessfulRecommendationRecord& record)
{
    QJsonObject payload;
    payload[QStringLiteral("recommendation")] = record.recommendation.toJson();
    payload[QStringLiteral("sustainedDurationMs")] = static_cast<double>(record.sustainedDurationMs);
    payload[QStringLiteral("sustainedTemp")] = record.recommendation.recommendedTemp;
    payload[QStringLiteral("energySavings")] = record.recommendation.energySavingsPct;

    std::lock_guard<std::mutex> lock(m_mutex);
    if (!recordEvent(kSuccessfulRecommendation, record.entityId, record.timestamp, payload)) {
        return;
    }
    DailyDelta delta;
    delta.successful = 1;
    delta.energySaved = record.recommendation.energySavingsPct;
    bumpDailyStats(record.entityId, record.timestamp, delta);
    LOG_DEBUG(tpStore, "Successful recommendation logged for '%s'", qUtf8Printable(record.entityId));
}

bool ActivityLogStore::recordEvent(const char* eventType,
                                   const QString& entityId,
                                   const QDateTime& timestamp,
                                   const QJsonObject& payload)
{
    static constexpr const char* kSql = R"(
        INSERT INTO activity_log (event_type, entity_id, timestamp, payload)
        VALUES (?1, ?2, ?3, ?4)
    )";

    sqlite3* db = m_db.handle();
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, kSql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_WARN(tpStore, "activity_log prepare failed: %s", sqlite3_errmsg(db));
        return false;
    }

    const QByteArray entityUtf8 = entityId.toUtf8();
    const QByteArray timestampUtf8 = toDbTimestamp(timestamp).toUtf8();
    const QByteArray payloadUtf8 = QJsonDocument(payload).toJson(QJsonDocument::Compact);

    sqlite3_bind_text(stmt, 1, eventType, -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, entityUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 3, timestampUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 4, payloadUtf8.constData(), -1, SQLITE_STATIC);

    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        LOG_WARN(tpStore, "activity_log insert failed: %s", sqlite3_errmsg(db));
        return false;
    }
    return true;
}

bool ActivityLogStore::bumpDailyStats(const QString& entityId,
                                      const QDateTime& timestamp,
                                      const DailyDelta& delta)
{
    static constexpr const char* kSql = R"(
        INSERT INTO daily_stats (entity_id, day, recommendations_applied, adjustments_made,
                                 successful, energy_saved, total_confidence)
        VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7)
        ON CONFLICT(entity_id, day) DO UPDATE SET
            recommendations_applied = daily_stats.recommendations_applied + excluded.recommendations_applied,
            adjustments_made = daily_stats.adjustments_made + excluded.adjustments_made,
            successful = daily_stats.successful + excluded.successful,
            energy_saved = daily_stats.energy_saved + excluded.energy_saved,
            total_confidence = daily_stats.total_confidence + excluded.total_confidence
    )";

    sqlite3* db = m_db.handle();
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, kSql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_WARN(tpStore, "daily_stats prepare failed: %s", sqlite3_errmsg(db));
        return false;
    }

    const QByteArray entityUtf8 = entityId.toUtf8();
    const QByteArray dayUtf8 = toDbDay(timestamp).toUtf8();
    sqlite3_bind_text(stmt, 1, entityUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, dayUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_int(stmt, 3, delta.applied);
    sqlite3_bind_int(stmt, 4, delta.adjustments);
    sqlite3_bind_int(stmt, 5, delta.successful);
    sqlite3_bind_double(stmt, 6, delta.energySaved);
    sqlite3_bind_double(stmt, 7, delta.confidence);

    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        LOG_WARN(tpStore, "daily_stats upsert failed: %s", sqlite3_errmsg(db));
        return false;
    }
    return true;
}

QJsonArray ActivityLogStore::recentActivity(const QString& entityId, int limit)
{
    static constexpr const char* kSql = R"(
        SELECT event_type, entity_id, timestamp, payload
        FROM activity_log
        WHERE (?1 IS NULL OR entity_id = ?1)
        ORDER BY timestamp DESC, id DESC
        LIMIT ?2
    )";

    QJsonArray output;
    std::lock_guard<std::mutex> lock(m_mutex);
    sqlite3* db = m_db.handle();
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, kSql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_WARN(tpStore, "recentActivity prepare failed: %s", sqlite3_errmsg(db));
        return output;
    }

    const QByteArray entityUtf8 = entityId.toUtf8();
    if (entityId.isEmpty()) {
        sqlite3_bind_null(stmt, 1);
    } else {
        sqlite3_bind_text(stmt, 1, entityUtf8.constData(), -1, SQLITE_STATIC);
    }
    sqlite3_bind_int(stmt, 2, std::max(0, limit));

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        const char* type = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
        const char* entity = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 1));
        const char* ts = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 2));
        const char* payload = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 3));

        QJsonObject row;
        row[QStringLiteral("type")] = type ? QString::fromUtf8(type) : QString();
        row[QStringLiteral("entityId")] = entity ? QString::fromUtf8(entity) : QString();
        row[QStringLiteral("timestamp")] = ts ? QString::fromUtf8(ts) : QString();
        if (payload) {
            row[QStringLiteral("details")] = QJsonDocument::fromJson(QByteArray(payload)).object();
        }
        output.append(row);
    }
    sqlite3_finalize(stmt);
    return output;
}

std::optional<DailyStats> ActivityLogStore::dailyStats(const QString& entityId, const QDate& day)
{
    static constexpr const char* kSql = R"(
        SELECT recommendations_applied, adjustments_made, successful, energy_saved, total_confidence
        FROM daily_stats
        WHERE entity_id = ?1 AND day = ?2
    )";

    std::lock_guard<std::mutex> lock(m_mutex);
    sqlite3* db = m_db.handle();
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, kSql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_WARN(tpStore, "dailyStats prepare failed: %s", sqlite3_errmsg(db));
        return std::nullopt;
    }

    const QByteArray entityUtf8 = entityId.toUtf8();
    const QByteArray dayUtf8 = day.toString(Qt::ISODate).toUtf8();
    sqlite3_bind_text(stmt, 1, entityUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, dayUtf8.constData(), -1, SQLITE_STATIC);

    std::optional<DailyStats> result;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        DailyStats stats;
        stats.entityId = entityId;
        stats.day = day;
        stats.recommendationsApplied = sqlite3_column_int(stmt, 0);
        stats.adjustmentsMade = sqlite3_column_int(stmt, 1);
        stats.successfulRecommendations = sqlite3_column_int(stmt, 2);
        stats.energySaved = sqlite3_column_double(stmt, 3);
        stats.totalConfidenceSum = sqlite3_column_double(stmt, 4);
        result = stats;
    }
    sqlite3_finalize(stmt);
    return result;
}

bool ActivityLogStore::cleanup(int retentionDays)
{
    const QDateTime cutoff = QDateTime::currentDateTimeUtc().addDays(-std::max(0, retentionDays));
    const QByteArray cutoffTs = toDbTimestamp(cutoff).toUtf8();
    const QByteArray cutoffDay = toDbDay(cutoff).toUtf8();

    std::lock_guard<std::mutex> lock(m_mutex);
    sqlite3* db = m_db.handle();

    auto runDelete = [db](const char* sql, const QByteArray& bound) -> int {
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            LOG_WARN(tpStore, "cleanup prepare failed: %s", sqlite3_errmsg(db));
            return -1;
        }
        sqlite3_bind_text(stmt, 1, bound.constData(), -1, SQLITE_STATIC);
        const int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE) {
            LOG_WARN(tpStore, "cleanup step failed: %s", sqlite3_errmsg(db));
            return -1;
        }
        return sqlite3_changes(db);
    };

    const int logRows = runDelete("DELETE FROM activity_log WHERE timestamp < ?1", cutoffTs);
    const int statRows = runDelete("DELETE FROM daily_stats WHERE day < ?1", cutoffDay);
    if (logRows < 0 || statRows < 0) {
        return false;
    }
    LOG_INFO(tpStore, "Activity cleanup removed %d log rows and %d daily rows", logRows, statRows);
    return true;
}

} // namespace tp
