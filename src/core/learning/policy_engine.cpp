#include "core/learning/policy_engine.h"
#include "core/learning/context_discretizer.h"
#include "core/learning/learning_state_store.h"
#include "core/shared/logging.h"

#include <algorithm>
#include <cmath>
#include <exception>

namespace tp {

namespace {

const QString kVersionTag = QStringLiteral("RL_v1.0");
const QString kFallbackVersionTag = QStringLiteral("fallback");

double confidenceFrom(bool contextVisited, int visits, int total, int successful)
{
    if (!contextVisited) {
        return PolicyEngine::kMinConfidence;
    }
    const double base = std::min(0.9, visits * 0.1);
    const double successRate = total > 0
        ? static_cast<double>(successful) / static_cast<double>(total)
        : 0.5;
    return std::clamp(base * (0.5 + successRate),
                      PolicyEngine::kMinConfidence,
                      PolicyEngine::kMaxConfidence);
}

} // namespace

PolicyEngine::PolicyEngine(LearningStateStore& store)
    : m_store(store)
    , m_rng(QRandomGenerator::securelySeeded())
{
}

PolicyEngine::PolicyEngine(LearningStateStore& store, quint32 seed)
    : m_store(store)
    , m_rng(seed)
{
}

PolicyEngine::Selection PolicyEngine::selectAction(const ActionValues& qValues, double epsilon)
{
    Selection selection;
    std::lock_guard<std::mutex> lock(m_rngMutex);
    if (m_rng.generateDouble() < epsilon) {
        const int pick = static_cast<int>(m_rng.bounded(static_cast<quint32>(kActionCount)));
        selection.action = kAllActions[static_cast<std::size_t>(pick)];
        selection.reason = ExplorationReason::Exploration;
        return selection;
    }
    selection.action = greedyAction(qValues);
    selection.reason = ExplorationReason::Exploitation;
    return selection;
}

Action PolicyEngine::greedyAction(const ActionValues& qValues)
{
    Action best = kAllActions.front();
    double bestValue = qValues[actionIndex(best)];
    for (Action action : kAllActions) {
        const double value = qValues[actionIndex(action)];
        if (value > bestValue) {
            bestValue = value;
            best = action;
        }
    }
    return best;
}

double PolicyEngine::confidence(const LearningState& state, const ContextKey& key, Action action)
{
    const auto it = state.visitCounts.constFind(key);
    if (it == state.visitCounts.constEnd()) {
        return kMinConfidence;
    }
    return confidenceFrom(true,
                          it.value()[actionIndex(action)],
                          state.totalRecommendations,
                          state.successfulRecommendations);
}

double PolicyEngine::confidence(const ContextView& view, Action action)
{
    return confidenceFrom(view.contextVisited,
                          view.visits[actionIndex(action)],
                          view.totalRecommendations,
                          view.successfulRecommendations);
}

double PolicyEngine::estimateEnergySavings(double currentTemp,
                                           double recommendedTemp,
                                           double outdoorTemp,
                                           const std::optional<EfficiencyContext>& efficiency)
{
    if (!efficiency.has_value() || currentTemp == recommendedTemp) {
        return 0.0;
    }

    const double currentDiff = std::abs(currentTemp - outdoorTemp);
    const double recommendedDiff = std::abs(recommendedTemp - outdoorTemp);
    if (!(recommendedDiff < currentDiff)) {
        return 0.0;
    }

    const double savingsPct = ((currentDiff - recommendedDiff) / currentDiff) * 100.0;
    return std::clamp(savingsPct, 0.0, kMaxEnergySavingsPct);
}

double PolicyEngine::clampTemperature(double temp)
{
    return std::clamp(temp, kMinTemperature, kMaxTemperature);
}

Recommendation PolicyEngine::fallback(const QString& entityId, double currentTarget, double outdoorTemp)
{
    // Without a usable outdoor reading, aim for the middle of the comfort range.
    const double anchor = std::isfinite(outdoorTemp)
        ? outdoorTemp + kFallbackOutdoorOffset
        : (kFallbackMinTemp + kFallbackMaxTemp) / 2.0;

    Recommendation rec;
    rec.entityId = entityId;
    rec.recommendedTemp = std::clamp(anchor, kFallbackMinTemp, kFallbackMaxTemp);
    rec.currentTemp = std::isfinite(currentTarget) ? currentTarget : rec.recommendedTemp;

    // The fallback target may be further away than the action space reaches;
    // the action records the closest representable step and temperatureDelta()
    // carries the real change.
    const double delta = std::clamp(std::round(rec.recommendedTemp - rec.currentTemp), -2.0, 2.0);
    rec.action = actionFromAdjustment(static_cast<int>(delta)).value_or(Action::Maintain);

    rec.confidence = kFallbackConfidence;
    rec.energySavingsPct = kFallbackEnergySavingsPct;
    rec.context = ContextDiscretizer::discretize(outdoorTemp, rec.currentTemp, RoomCategory::Medium);
    rec.reason = ExplorationReason::Fallback;
    rec.timestamp = QDateTime::currentDateTimeUtc();
    rec.fallback = true;
    rec.version = kFallbackVersionTag;
    return rec;
}

Recommendation PolicyEngine::recommend(const QString& entityId,
                                       double outdoorTemp,
                                       double currentTarget,
                                       RoomCategory room,
                                       const std::optional<EfficiencyContext>& efficiency)
{
    if (entityId.trimmed().isEmpty()) {
        LOG_WARN(tpLearning, "Recommendation requested without an entity id; using fallback");
        return fallback(entityId, currentTarget, outdoorTemp);
    }
    if (!std::isfinite(outdoorTemp) || !std::isfinite(currentTarget)) {
        LOG_WARN(tpLearning, "Non-finite temperatures for '%s' (outdoor=%f target=%f); using fallback",
                 qUtf8Printable(entityId), outdoorTemp, currentTarget);
        return fallback(entityId, currentTarget, outdoorTemp);
    }

    try {
        return recommendUnchecked(entityId, outdoorTemp, currentTarget, room, efficiency);
    } catch (const std::exception& e) {
        LOG_ERROR(tpLearning, "Recommendation failed for '%s': %s; using fallback",
                  qUtf8Printable(entityId), e.what());
        return fallback(entityId, currentTarget, outdoorTemp);
    }
}

Recommendation PolicyEngine::recommendUnchecked(const QString& entityId,
                                                double outdoorTemp,
                                                double currentTarget,
                                                RoomCategory room,
                                                const std::optional<EfficiencyContext>& efficiency)
{
    const ContextKey key = ContextDiscretizer::discretize(outdoorTemp, currentTarget, room);
    const ContextView view = m_store.view(entityId, key);
    const Selection selection = selectAction(view.qValues, m_store.epsilon());

    Recommendation rec;
    rec.entityId = entityId;
    rec.action = selection.action;
    rec.reason = selection.reason;
    rec.currentTemp = currentTarget;
    rec.recommendedTemp = clampTemperature(currentTarget + actionAdjustment(selection.action));
    rec.confidence = confidence(view, selection.action);
    rec.energySavingsPct = estimateEnergySavings(currentTarget, rec.recommendedTemp,
                                                 outdoorTemp, efficiency);
    rec.context = key;
    rec.timestamp = QDateTime::currentDateTimeUtc();
    rec.fallback = false;
    rec.version = kVersionTag;

    LOG_DEBUG(tpLearning, "Recommendation for '%s' in %s: %s -> %.1f (confidence %.2f, %s)",
              qUtf8Printable(entityId),
              qUtf8Printable(key.toString()),
              qUtf8Printable(actionToString(rec.action)),
              rec.recommendedTemp,
              rec.confidence,
              qUtf8Printable(explorationReasonToString(rec.reason)));
    return rec;
}

} // namespace tp
