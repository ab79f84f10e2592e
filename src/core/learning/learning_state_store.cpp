#include "core/learning/learning_state_store.h"
#include "core/shared/logging.h"

#include <algorithm>
#include <cmath>
#include <vector>

namespace tp {

namespace {

double successRateOf(int total, int successful)
{
    return total > 0 ? static_cast<double>(successful) / static_cast<double>(total) : 0.0;
}

} // namespace

LearningStateStore::LearningStateStore(Config config, ExplorationSchedule::Config exploration)
    : m_config(config)
    , m_exploration(exploration)
{
}

std::shared_ptr<LearningStateStore::Slot> LearningStateStore::slotFor(const QString& entityId,
                                                                      bool create) const
{
    std::lock_guard<std::mutex> lock(m_slotsMutex);
    auto it = m_slots.find(entityId);
    if (it != m_slots.end()) {
        return it.value();
    }
    if (!create) {
        return nullptr;
    }
    auto slot = std::make_shared<Slot>();
    m_slots.insert(entityId, slot);
    LOG_DEBUG(tpLearning, "Created learning state for entity '%s'", qUtf8Printable(entityId));
    return slot;
}

ActionValues& LearningStateStore::ensureContext(LearningState& state, const ContextKey& key) const
{
    auto it = state.qTable.find(key);
    if (it == state.qTable.end()) {
        ActionValues initial;
        initial.fill(m_config.optimisticInitialValue);
        it = state.qTable.insert(key, initial);
    }
    return it.value();
}

LearningState LearningStateStore::getOrCreate(const QString& entityId)
{
    auto slot = slotFor(entityId, true);
    std::lock_guard<std::mutex> lock(slot->mutex);
    return slot->state;
}

std::optional<LearningState> LearningStateStore::find(const QString& entityId) const
{
    auto slot = slotFor(entityId, false);
    if (!slot) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(slot->mutex);
    return slot->state;
}

ActionValues LearningStateStore::qValues(const QString& entityId, const ContextKey& key)
{
    return view(entityId, key).qValues;
}

ContextView LearningStateStore::view(const QString& entityId, const ContextKey& key)
{
    auto slot = slotFor(entityId, true);
    std::lock_guard<std::mutex> lock(slot->mutex);

    ContextView out;
    out.qValues = ensureContext(slot->state, key);
    const auto countsIt = slot->state.visitCounts.constFind(key);
    if (countsIt != slot->state.visitCounts.constEnd()) {
        out.visits = countsIt.value();
        out.contextVisited = true;
    } else {
        out.visits.fill(0);
    }
    out.totalRecommendations = slot->state.totalRecommendations;
    out.successfulRecommendations = slot->state.successfulRecommendations;
    return out;
}

std::optional<LearningStateStore::UpdateResult> LearningStateStore::update(const QString& entityId,
                                                                          const ContextKey& key,
                                                                          Action action,
                                                                          double reward)
{
    if (entityId.isEmpty()) {
        LOG_WARN(tpLearning, "Rejected update with empty entity id");
        return std::nullopt;
    }
    if (!std::isfinite(reward)) {
        LOG_WARN(tpLearning, "Rejected non-finite reward for entity '%s'", qUtf8Printable(entityId));
        return std::nullopt;
    }

    auto slot = slotFor(entityId, true);
    UpdateResult result;
    {
        std::lock_guard<std::mutex> lock(slot->mutex);
        LearningState& state = slot->state;
        const std::size_t idx = actionIndex(action);

        ActionValues& q = ensureContext(state, key);
        result.previousQ = q[idx];
        q[idx] = result.previousQ + m_config.learningRate * (reward - result.previousQ);
        result.newQ = q[idx];

        auto countsIt = state.visitCounts.find(key);
        if (countsIt == state.visitCounts.end()) {
            ActionCounts zero;
            zero.fill(0);
            countsIt = state.visitCounts.insert(key, zero);
        }
        result.visitCount = ++countsIt.value()[idx];

        ++state.totalRecommendations;
        if (reward > 0.0) {
            ++state.successfulRecommendations;
        }

        const int adjustment = actionAdjustment(action);
        if (reward > 0.0) {
            state.personalizedBias += adjustment * m_config.biasStepOnSuccess;
        } else {
            state.personalizedBias -= adjustment * m_config.biasStepOnFailure;
        }
        state.personalizedBias = std::clamp(state.personalizedBias,
                                            -m_config.biasLimit,
                                            m_config.biasLimit);
        result.personalizedBias = state.personalizedBias;

        const QDateTime now = QDateTime::currentDateTimeUtc();
        AdaptationEvent event;
        event.timestamp = now;
        event.adjustment = adjustment;
        event.reward = reward;
        event.bias = state.personalizedBias;
        state.adaptationHistory.push_back(event);
        const int overflow = static_cast<int>(state.adaptationHistory.size()) - m_config.historyCapacity;
        if (overflow > 0) {
            state.adaptationHistory.remove(0, overflow);
        }
        state.lastUpdate = now;
    }

    result.epsilon = m_exploration.decay();

    LOG_DEBUG(tpLearning, "Q updated for '%s' %s/%s: %.4f -> %.4f (reward %.2f, epsilon %.4f)",
              qUtf8Printable(entityId),
              qUtf8Printable(key.toString()),
              qUtf8Printable(actionToString(action)),
              result.previousQ, result.newQ, reward, result.epsilon);
    return result;
}

bool LearningStateStore::reset(const QString& entityId)
{
    std::lock_guard<std::mutex> lock(m_slotsMutex);
    const bool removed = m_slots.remove(entityId) > 0;
    if (removed) {
        LOG_INFO(tpLearning, "Learning data reset for entity '%s'", qUtf8Printable(entityId));
    }
    return removed;
}

void LearningStateStore::resetAll()
{
    {
        std::lock_guard<std::mutex> lock(m_slotsMutex);
        m_slots.clear();
    }
    m_exploration.reset();
    LOG_INFO(tpLearning, "All learning data reset");
}

LearningSnapshot LearningStateStore::snapshot() const
{
    std::vector<std::pair<QString, std::shared_ptr<Slot>>> slots;
    {
        std::lock_guard<std::mutex> lock(m_slotsMutex);
        slots.reserve(static_cast<std::size_t>(m_slots.size()));
        for (auto it = m_slots.cbegin(); it != m_slots.cend(); ++it) {
            slots.emplace_back(it.key(), it.value());
        }
    }

    LearningSnapshot out;
    out.epsilon = m_exploration.epsilon();
    out.savedAt = QDateTime::currentDateTimeUtc();
    for (const auto& [entityId, slot] : slots) {
        std::lock_guard<std::mutex> lock(slot->mutex);
        out.entities.insert(entityId, slot->state);
    }
    return out;
}

void LearningStateStore::restore(const LearningSnapshot& snapshot)
{
    QHash<QString, std::shared_ptr<Slot>> restored;
    for (auto it = snapshot.entities.cbegin(); it != snapshot.entities.cend(); ++it) {
        if (it.key().isEmpty()) {
            continue;
        }
        auto slot = std::make_shared<Slot>();
        slot->state = it.value();
        slot->state.personalizedBias = std::clamp(slot->state.personalizedBias,
                                                  -m_config.biasLimit,
                                                  m_config.biasLimit);
        const int overflow = static_cast<int>(slot->state.adaptationHistory.size())
                             - m_config.historyCapacity;
        if (overflow > 0) {
            slot->state.adaptationHistory.remove(0, overflow);
        }
        restored.insert(it.key(), slot);
    }

    {
        std::lock_guard<std::mutex> lock(m_slotsMutex);
        m_slots.swap(restored);
    }
    m_exploration.restore(snapshot.epsilon);
    LOG_INFO(tpLearning, "Restored learning state for %d entities (epsilon %.4f)",
             static_cast<int>(snapshot.entities.size()), m_exploration.epsilon());
}

std::optional<EntityStatistics> LearningStateStore::statistics(const QString& entityId) const
{
    auto slot = slotFor(entityId, false);
    if (!slot) {
        return std::nullopt;
    }

    EntityStatistics stats;
    stats.entityId = entityId;
    {
        std::lock_guard<std::mutex> lock(slot->mutex);
        stats.totalRecommendations = slot->state.totalRecommendations;
        stats.successfulRecommendations = slot->state.successfulRecommendations;
        stats.personalizedBias = slot->state.personalizedBias;
        stats.exploredContexts = static_cast<int>(slot->state.qTable.size());
        stats.lastUpdate = slot->state.lastUpdate;
    }
    stats.successRate = successRateOf(stats.totalRecommendations, stats.successfulRecommendations);
    stats.currentEpsilon = m_exploration.epsilon();
    return stats;
}

AggregateStatistics LearningStateStore::aggregateStatistics() const
{
    const LearningSnapshot all = snapshot();

    AggregateStatistics stats;
    stats.entityCount = static_cast<int>(all.entities.size());
    for (const LearningState& state : all.entities) {
        stats.totalRecommendations += state.totalRecommendations;
        stats.successfulRecommendations += state.successfulRecommendations;
        stats.exploredContexts += static_cast<int>(state.qTable.size());
    }
    stats.successRate = successRateOf(stats.totalRecommendations, stats.successfulRecommendations);
    stats.currentEpsilon = all.epsilon;
    return stats;
}

double LearningStateStore::epsilon() const
{
    return m_exploration.epsilon();
}

int LearningStateStore::entityCount() const
{
    std::lock_guard<std::mutex> lock(m_slotsMutex);
    return static_cast<int>(m_slots.size());
}

QStringList LearningStateStore::entityIds() const
{
    std::lock_guard<std::mutex> lock(m_slotsMutex);
    QStringList ids = m_slots.keys();
    ids.sort();
    return ids;
}

} // namespace tp
