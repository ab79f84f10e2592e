#include "core/shared/types.h"

namespace tp {

int actionAdjustment(Action action)
{
    switch (action) {
    case Action::Decrease2: return -2;
    case Action::Decrease1: return -1;
    case Action::Maintain:  return 0;
    case Action::Increase1: return 1;
    case Action::Increase2: return 2;
    }
    return 0;
}

QString actionToString(Action action)
{
    switch (action) {
    case Action::Decrease2: return QStringLiteral("decrease_2");
    case Action::Decrease1: return QStringLiteral("decrease_1");
    case Action::Maintain:  return QStringLiteral("maintain");
    case Action::Increase1: return QStringLiteral("increase_1");
    case Action::Increase2: return QStringLiteral("increase_2");
    }
    return QStringLiteral("maintain");
}

std::optional<Action> actionFromString(const QString& str)
{
    if (str == QLatin1String("decrease_2")) return Action::Decrease2;
    if (str == QLatin1String("decrease_1")) return Action::Decrease1;
    if (str == QLatin1String("maintain"))   return Action::Maintain;
    if (str == QLatin1String("increase_1")) return Action::Increase1;
    if (str == QLatin1String("increase_2")) return Action::Increase2;
    return std::nullopt;
}

std::optional<Action> actionFromAdjustment(int adjustment)
{
    for (Action action : kAllActions) {
        if (actionAdjustment(action) == adjustment) {
            return action;
        }
    }
    return std::nullopt;
}

QString outdoorBandToString(OutdoorBand band)
{
    switch (band) {
    case OutdoorBand::Cool:    return QStringLiteral("cool");
    case OutdoorBand::Mild:    return QStringLiteral("mild");
    case OutdoorBand::Warm:    return QStringLiteral("warm");
    case OutdoorBand::Hot:     return QStringLiteral("hot");
    case OutdoorBand::Extreme: return QStringLiteral("extreme");
    }
    return QStringLiteral("mild");
}

std::optional<OutdoorBand> outdoorBandFromString(const QString& str)
{
    if (str == QLatin1String("cool"))    return OutdoorBand::Cool;
    if (str == QLatin1String("mild"))    return OutdoorBand::Mild;
    if (str == QLatin1String("warm"))    return OutdoorBand::Warm;
    if (str == QLatin1String("hot"))     return OutdoorBand::Hot;
    if (str == QLatin1String("extreme")) return OutdoorBand::Extreme;
    return std::nullopt;
}

QString targetBandToString(TargetBand band)
{
    switch (band) {
    case TargetBand::Cold:        return QStringLiteral("cold");
    case TargetBand::Comfortable: return QStringLiteral("comfortable");
    case TargetBand::WarmIndoor:  return QStringLiteral("warm_indoor");
    }
    return QStringLiteral("comfortable");
}

std::optional<TargetBand> targetBandFromString(const QString& str)
{
    if (str == QLatin1String("cold"))        return TargetBand::Cold;
    if (str == QLatin1String("comfortable")) return TargetBand::Comfortable;
    if (str == QLatin1String("warm_indoor")) return TargetBand::WarmIndoor;
    return std::nullopt;
}

QString roomCategoryToString(RoomCategory category)
{
    switch (category) {
    case RoomCategory::Small:  return QStringLiteral("small");
    case RoomCategory::Medium: return QStringLiteral("medium");
    case RoomCategory::Large:  return QStringLiteral("large");
    case RoomCategory::XLarge: return QStringLiteral("xlarge");
    }
    return QStringLiteral("medium");
}

RoomCategory roomCategoryFromString(const QString& str)
{
    const QString normalized = str.trimmed().toLower();
    if (normalized == QLatin1String("small"))  return RoomCategory::Small;
    if (normalized == QLatin1String("large"))  return RoomCategory::Large;
    if (normalized == QLatin1String("xlarge")) return RoomCategory::XLarge;
    return RoomCategory::Medium;
}

QString ContextKey::toString() const
{
    return QStringLiteral("%1_%2_%3")
        .arg(outdoorBandToString(outdoor),
             targetBandToString(target),
             roomCategoryToString(room));
}

} // namespace tp
