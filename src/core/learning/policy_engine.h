#pragma once

#include "core/learning/learning_state.h"
#include "core/shared/recommendation.h"

#include <QRandomGenerator>
#include <QString>

#include <mutex>
#include <optional>

namespace tp {

class LearningStateStore;

// PolicyEngine -- epsilon-greedy action selection over the learned Q-values
// and the scoring that goes with a recommendation.
class PolicyEngine {
public:
    static constexpr double kMinTemperature = 16.0;
    static constexpr double kMaxTemperature = 30.0;
    static constexpr double kMinConfidence = 0.1;
    static constexpr double kMaxConfidence = 0.95;
    static constexpr double kMaxEnergySavingsPct = 30.0;
    static constexpr double kFallbackOutdoorOffset = 5.0;
    static constexpr double kFallbackMinTemp = 22.0;
    static constexpr double kFallbackMaxTemp = 26.0;
    static constexpr double kFallbackConfidence = 0.3;
    static constexpr double kFallbackEnergySavingsPct = 5.0;

    struct Selection {
        Action action = Action::Maintain;
        ExplorationReason reason = ExplorationReason::Exploitation;
    };

    explicit PolicyEngine(LearningStateStore& store);
    PolicyEngine(LearningStateStore& store, quint32 seed);

    // With probability epsilon a uniformly random action, otherwise the
    // greedy one.
    Selection selectAction(const ActionValues& qValues, double epsilon);

    // Highest Q-value; ties go to the first action in declaration order.
    static Action greedyAction(const ActionValues& qValues);

    static double confidence(const LearningState& state, const ContextKey& key, Action action);
    static double confidence(const ContextView& view, Action action);

    // Percent reduction of |temp - outdoor|, capped at 30. Zero without an
    // efficiency context or when the distance does not shrink.
    static double estimateEnergySavings(double currentTemp,
                                        double recommendedTemp,
                                        double outdoorTemp,
                                        const std::optional<EfficiencyContext>& efficiency);

    static double clampTemperature(double temp);

    static Recommendation fallback(const QString& entityId, double currentTarget, double outdoorTemp);

    // Full recommendation flow for one entity. Never fails: invalid input or
    // an internal error yields fallback().
    Recommendation recommend(const QString& entityId,
                             double outdoorTemp,
                             double currentTarget,
                             RoomCategory room,
                             const std::optional<EfficiencyContext>& efficiency);

private:
    Recommendation recommendUnchecked(const QString& entityId,
                                      double outdoorTemp,
                                      double currentTarget,
                                      RoomCategory room,
                                      const std::optional<EfficiencyContext>& efficiency);

    LearningStateStore& m_store;
    std::mutex m_rngMutex;
    QRandomGenerator m_rng;
};

} // namespace tp
