#pragma once

#include "core/feedback/activity_logger.h"
#include "core/store/learning_database.h"

#include <QDate>
#include <QJsonArray>
#include <QJsonObject>
#include <QString>

#include <memory>
#include <mutex>
#include <optional>

namespace tp {

struct DailyStats {
    QString entityId;
    QDate day;
    int recommendationsApplied = 0;
    int adjustmentsMade = 0;
    int successfulRecommendations = 0;
    double energySaved = 0.0;
    double totalConfidenceSum = 0.0;

    double averageConfidence() const;
    // (applied - adjustments) / applied, floored at 0. 0 when nothing applied.
    double successRate() const;
    QJsonObject toJson() const;
};

// ActivityLogStore -- ActivityLogger backed by the learning database.
//
// Every event becomes one activity_log row with a JSON payload and bumps the
// per-entity, per-day counters in daily_stats. Write failures are logged and
// swallowed; the learning path never sees them.
class ActivityLogStore : public ActivityLogger {
public:
    static constexpr const char* kRecommendationApplied = "recommendation_applied";
    static constexpr const char* kManualAdjustment = "manual_adjustment";
    static constexpr const char* kSuccessfulRecommendation = "successful_recommendation";

    static std::unique_ptr<ActivityLogStore> open(const QString& dbPath, QString* errorOut = nullptr);

    explicit ActivityLogStore(LearningDatabase db);

    void logRecommendationApplication(const RecommendationApplicationRecord& record) override;
    void logManualAdjustment(const ManualAdjustmentRecord& record) override;
    void logSuccessfulRecommendation(const SuccessfulRecommendationRecord& record) override;

    // Newest first. An empty entityId returns events for every entity.
    QJsonArray recentActivity(const QString& entityId, int limit = 50);
    std::optional<DailyStats> dailyStats(const QString& entityId, const QDate& day);
    bool cleanup(int retentionDays = 90);

    static QString adjustmentDirection(double previousTemp, double newTemp);

private:
    bool recordEvent(const char* eventType,
                     const QString& entityId,
                     const QDateTime& timestamp,
                     const QJsonObject& payload);

    struct DailyDelta {
        int applied = 0;
        int adjustments = 0;
        int successful = 0;
        double energySaved = 0.0;
        double confidence = 0.0;
    };
    bool bumpDailyStats(const QString& entityId, const QDateTime& timestamp, const DailyDelta& delta);

    std::mutex m_mutex;
    LearningDatabase m_db;
};

} // namespace tp
