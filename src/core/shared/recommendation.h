#pragma once

#include "core/shared/types.h"

#include <QDateTime>
#include <QJsonObject>
#include <QString>

namespace tp {

// Optional efficiency data supplied by the caller. Its presence enables the
// energy-saving estimate; the fields are carried through to activity logs.
struct EfficiencyContext {
    QString unitType;            // e.g. "1.5HP"
    double currentPowerW = 0.0;
    int hourOfDay = -1;          // -1 when unknown
};

enum class ExplorationReason {
    Exploration,
    Exploitation,
    Fallback,
};

QString explorationReasonToString(ExplorationReason reason);

struct Recommendation {
    QString entityId;
    Action action = Action::Maintain;
    double recommendedTemp = 0.0;
    double currentTemp = 0.0;
    double confidence = 0.0;
    double energySavingsPct = 0.0;
    ContextKey context;
    ExplorationReason reason = ExplorationReason::Exploitation;
    QDateTime timestamp;
    bool fallback = false;
    QString version;

    int adjustment() const { return actionAdjustment(action); }
    // Differs from adjustment() when a fallback target lies beyond +/-2.
    double temperatureDelta() const { return recommendedTemp - currentTemp; }
    QJsonObject toJson() const;
};

QJsonObject contextKeyToJson(const ContextKey& key);

} // namespace tp
