#pragma once

#include "core/shared/types.h"

#include <QDateTime>
#include <QMap>
#include <QString>
#include <QVector>

#include <array>

namespace tp {

using ActionValues = std::array<double, kActionCount>;
using ActionCounts = std::array<int, kActionCount>;

struct AdaptationEvent {
    QDateTime timestamp;
    int adjustment = 0;
    double reward = 0.0;
    double bias = 0.0;  // personalized bias after the event
};

// Learned state for one controlled unit. Only LearningStateStore mutates it;
// everything else sees copies.
struct LearningState {
    QMap<ContextKey, ActionValues> qTable;
    QMap<ContextKey, ActionCounts> visitCounts;
    int totalRecommendations = 0;
    int successfulRecommendations = 0;
    double personalizedBias = 0.0;
    QVector<AdaptationEvent> adaptationHistory;  // oldest first
    QDateTime lastUpdate;
};

// Everything the policy needs about one (entity, context) pair, read under a
// single lock.
struct ContextView {
    ActionValues qValues{};
    ActionCounts visits{};
    bool contextVisited = false;
    int totalRecommendations = 0;
    int successfulRecommendations = 0;
};

struct LearningSnapshot {
    int version = 1;
    double epsilon = 0.1;
    QDateTime savedAt;
    QMap<QString, LearningState> entities;

    bool isEmpty() const { return entities.isEmpty(); }
};

struct EntityStatistics {
    QString entityId;
    int totalRecommendations = 0;
    int successfulRecommendations = 0;
    double successRate = 0.0;  // 0..1
    double personalizedBias = 0.0;
    int exploredContexts = 0;
    double currentEpsilon = 0.0;
    QDateTime lastUpdate;
};

struct AggregateStatistics {
    int entityCount = 0;
    int totalRecommendations = 0;
    int successfulRecommendations = 0;
    double successRate = 0.0;  // 0..1
    int exploredContexts = 0;
    double currentEpsilon = 0.0;
};

} // namespace tp
