#pragma once

#include <QString>

#include <array>
#include <cstddef>
#include <optional>

namespace tp {

// Thermostat adjustments in declaration order. The order is part of the
// learning contract: greedy ties resolve to the earliest action.
enum class Action {
    Decrease2,
    Decrease1,
    Maintain,
    Increase1,
    Increase2,
};

constexpr std::size_t kActionCount = 5;
constexpr std::array<Action, kActionCount> kAllActions = {
    Action::Decrease2,
    Action::Decrease1,
    Action::Maintain,
    Action::Increase1,
    Action::Increase2,
};

constexpr std::size_t actionIndex(Action action)
{
    return static_cast<std::size_t>(action);
}

int actionAdjustment(Action action);
QString actionToString(Action action);
std::optional<Action> actionFromString(const QString& str);
std::optional<Action> actionFromAdjustment(int adjustment);

// Outdoor temperature bands (degrees Celsius, half-open ranges)
enum class OutdoorBand {
    Cool,     // [15, 20)
    Mild,     // [20, 25)
    Warm,     // [25, 30)
    Hot,      // [30, 35)
    Extreme,  // [35, 45)
};

// Target (indoor set-point) bands
enum class TargetBand {
    Cold,         // [16, 20)
    Comfortable,  // [20, 24)
    WarmIndoor,   // [24, 28)
};

enum class RoomCategory {
    Small,
    Medium,
    Large,
    XLarge,
};

QString outdoorBandToString(OutdoorBand band);
std::optional<OutdoorBand> outdoorBandFromString(const QString& str);
QString targetBandToString(TargetBand band);
std::optional<TargetBand> targetBandFromString(const QString& str);
QString roomCategoryToString(RoomCategory category);

// Unknown or empty labels normalize to Medium.
RoomCategory roomCategoryFromString(const QString& str);

struct ContextKey {
    OutdoorBand outdoor = OutdoorBand::Mild;
    TargetBand target = TargetBand::Comfortable;
    RoomCategory room = RoomCategory::Medium;

    // "hot_comfortable_medium"
    QString toString() const;
};

inline bool operator==(const ContextKey& a, const ContextKey& b)
{
    return a.outdoor == b.outdoor && a.target == b.target && a.room == b.room;
}

inline bool operator!=(const ContextKey& a, const ContextKey& b)
{
    return !(a == b);
}

inline bool operator<(const ContextKey& a, const ContextKey& b)
{
    if (a.outdoor != b.outdoor) return a.outdoor < b.outdoor;
    if (a.target != b.target) return a.target < b.target;
    return a.room < b.room;
}

} // namespace tp
