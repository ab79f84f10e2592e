#include "core/shared/recommendation.h"

namespace tp {

QString explorationReasonToString(ExplorationReason reason)
{
    switch (reason) {
    case ExplorationReason::Exploration:  return QStringLiteral("exploration");
    case ExplorationReason::Exploitation: return QStringLiteral("exploitation");
    case ExplorationReason::Fallback:     return QStringLiteral("fallback");
    }
    return QStringLiteral("exploitation");
}

QJsonObject contextKeyToJson(const ContextKey& key)
{
    QJsonObject json;
    json[QStringLiteral("outdoor")] = outdoorBandToString(key.outdoor);
    json[QStringLiteral("target")] = targetBandToString(key.target);
    json[QStringLiteral("room")] = roomCategoryToString(key.room);
    json[QStringLiteral("stateKey")] = key.toString();
    return json;
}

QJsonObject Recommendation::toJson() const
{
    QJsonObject json;
    json[QStringLiteral("entityId")] = entityId;
    json[QStringLiteral("action")] = actionToString(action);
    json[QStringLiteral("adjustment")] = adjustment();
    json[QStringLiteral("recommendedTemp")] = recommendedTemp;
    json[QStringLiteral("currentTemp")] = currentTemp;
    json[QStringLiteral("temperatureDelta")] = temperatureDelta();
    json[QStringLiteral("confidence")] = confidence;
    json[QStringLiteral("energySavings")] = energySavingsPct;
    json[QStringLiteral("context")] = contextKeyToJson(context);
    json[QStringLiteral("explorationReason")] = explorationReasonToString(reason);
    json[QStringLiteral("timestamp")] = timestamp.toMSecsSinceEpoch();
    json[QStringLiteral("fallback")] = fallback;
    json[QStringLiteral("version")] = version;
    return json;
}

} // namespace tp
