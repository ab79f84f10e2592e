#include "core/learning/context_discretizer.h"

#include <array>
#include <cmath>

namespace tp {

namespace {

template <typename Band>
struct Range {
    double min;
    double max;
    Band band;
};

constexpr std::array<Range<OutdoorBand>, 5> kOutdoorRanges = {{
    {15.0, 20.0, OutdoorBand::Cool},
    {20.0, 25.0, OutdoorBand::Mild},
    {25.0, 30.0, OutdoorBand::Warm},
    {30.0, 35.0, OutdoorBand::Hot},
    {35.0, 45.0, OutdoorBand::Extreme},
}};

constexpr std::array<Range<TargetBand>, 3> kTargetRanges = {{
    {16.0, 20.0, TargetBand::Cold},
    {20.0, 24.0, TargetBand::Comfortable},
    {24.0, 28.0, TargetBand::WarmIndoor},
}};

template <typename Band, std::size_t N>
Band lookup(double value, const std::array<Range<Band>, N>& ranges)
{
    if (std::isnan(value)) {
        return ranges.back().band;
    }
    if (value < ranges.front().min) {
        return ranges.front().band;
    }
    for (const Range<Band>& range : ranges) {
        if (value >= range.min && value < range.max) {
            return range.band;
        }
    }
    return ranges.back().band;
}

} // namespace

OutdoorBand ContextDiscretizer::outdoorBand(double outdoorTemp)
{
    return lookup(outdoorTemp, kOutdoorRanges);
}

TargetBand ContextDiscretizer::targetBand(double targetTemp)
{
    return lookup(targetTemp, kTargetRanges);
}

ContextKey ContextDiscretizer::discretize(double outdoorTemp,
                                          double targetTemp,
                                          const QString& roomCategory)
{
    return discretize(outdoorTemp, targetTemp, roomCategoryFromString(roomCategory));
}

ContextKey ContextDiscretizer::discretize(double outdoorTemp,
                                          double targetTemp,
                                          RoomCategory roomCategory)
{
    ContextKey key;
    key.outdoor = outdoorBand(outdoorTemp);
    key.target = targetBand(targetTemp);
    key.room = roomCategory;
    return key;
}

} // namespace tp
