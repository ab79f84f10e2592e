#pragma once

#include "core/learning/exploration_schedule.h"
#include "core/learning/learning_state.h"

#include <QHash>
#include <QString>
#include <QStringList>

#include <memory>
#include <mutex>
#include <optional>

namespace tp {

struct LearningStateStoreConfig {
    double learningRate = 0.1;
    double optimisticInitialValue = 0.5;
    int historyCapacity = 100;
    double biasLimit = 2.0;
    double biasStepOnSuccess = 0.1;
    double biasStepOnFailure = 0.05;
};

// LearningStateStore -- exclusive owner of every entity's learning state and
// of the shared exploration rate.
//
// Mutations for one entity are serialized by a per-entity lock; different
// entities never contend beyond the short lookup of their slot. Callers only
// ever receive copies.
class LearningStateStore {
public:
    using Config = LearningStateStoreConfig;

    struct UpdateResult {
        double previousQ = 0.0;
        double newQ = 0.0;
        int visitCount = 0;
        double personalizedBias = 0.0;
        double epsilon = 0.0;
    };

    explicit LearningStateStore(Config config = {},
                                ExplorationSchedule::Config exploration = {});

    LearningStateStore(const LearningStateStore&) = delete;
    LearningStateStore& operator=(const LearningStateStore&) = delete;

    // Inserts an empty state when the entity is unknown.
    LearningState getOrCreate(const QString& entityId);
    std::optional<LearningState> find(const QString& entityId) const;

    // Q-values for every action under the context. Unseen pairs are
    // initialized to the optimistic default as a side effect.
    ActionValues qValues(const QString& entityId, const ContextKey& key);
    ContextView view(const QString& entityId, const ContextKey& key);

    // Incremental bandit update Q += lr * (reward - Q), plus counters, bias,
    // adaptation history and one decay step of the shared exploration rate.
    // Returns nullopt for an empty entity id or a non-finite reward.
    std::optional<UpdateResult> update(const QString& entityId,
                                       const ContextKey& key,
                                       Action action,
                                       double reward);

    // Returns true if the entity had state.
    bool reset(const QString& entityId);

    // Drops every entity and restores the initial exploration rate.
    void resetAll();

    LearningSnapshot snapshot() const;
    void restore(const LearningSnapshot& snapshot);

    std::optional<EntityStatistics> statistics(const QString& entityId) const;
    AggregateStatistics aggregateStatistics() const;

    double epsilon() const;
    int entityCount() const;
    QStringList entityIds() const;

    const Config& config() const { return m_config; }

private:
    struct Slot {
        mutable std::mutex mutex;
        LearningState state;
    };

    std::shared_ptr<Slot> slotFor(const QString& entityId, bool create) const;
    ActionValues& ensureContext(LearningState& state, const ContextKey& key) const;

    Config m_config;
    ExplorationSchedule m_exploration;

    mutable std::mutex m_slotsMutex;
    mutable QHash<QString, std::shared_ptr<Slot>> m_slots;
};

} // namespace tp
