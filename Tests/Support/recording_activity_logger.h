#pragma once

#include "core/feedback/activity_logger.h"

#include <QVector>

#include <mutex>

namespace tp::test {

class RecordingActivityLogger final : public ActivityLogger {
public:
    void logRecommendationApplication(const RecommendationApplicationRecord& record) override
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_applications.push_back(record);
    }

    void logManualAdjustment(const ManualAdjustmentRecord& record) override
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_adjustments.push_back(record);
    }

    void logSuccessfulRecommendation(const SuccessfulRecommendationRecord& record) override
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_successes.push_back(record);
    }

    QVector<RecommendationApplicationRecord> applications() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_applications;
    }

    QVector<ManualAdjustmentRecord> adjustments() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_adjustments;
    }

    QVector<SuccessfulRecommendationRecord> successes() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_successes;
    }

private:
    mutable std::mutex m_mutex;
    QVector<RecommendationApplicationRecord> m_applications;
    QVector<ManualAdjustmentRecord> m_adjustments;
    QVector<SuccessfulRecommendationRecord> m_successes;
};

} // namespace tp::test
