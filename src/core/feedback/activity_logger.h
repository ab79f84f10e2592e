#pragma once

#include "core/shared/recommendation.h"

#include <QDateTime>
#include <QString>

#include <cstdint>

namespace tp {

struct RecommendationApplicationRecord {
    QString entityId;
    double recommendedTemp = 0.0;
    double originalTemp = 0.0;
    QString appliedBy;
    double confidence = 0.0;
    double energySavingsPct = 0.0;
    ContextKey context;
    ExplorationReason reason = ExplorationReason::Exploitation;
    QDateTime timestamp;
};

struct ManualAdjustmentRecord {
    QString entityId;
    double recommendedTemp = 0.0;
    double adjustedTemp = 0.0;
    double previousTemp = 0.0;
    int64_t adjustmentTimeMs = 0;  // time since the window was armed
    QString changedBy;
    ContextKey context;
    QDateTime timestamp;
};

struct SuccessfulRecommendationRecord {
    QString entityId;
    Recommendation recommendation;
    int64_t sustainedDurationMs = 0;
    QDateTime timestamp;
};

// Outbound activity sink. Implementations are best-effort: failures are
// logged and never reported back to the learning path.
class ActivityLogger {
public:
    virtual ~ActivityLogger() = default;

    virtual void logRecommendationApplication(const RecommendationApplicationRecord& record) = 0;
    virtual void logManualAdjustment(const ManualAdjustmentRecord& record) = 0;
    virtual void logSuccessfulRecommendation(const SuccessfulRecommendationRecord& record) = 0;
};

} // namespace tp
