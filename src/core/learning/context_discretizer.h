#pragma once

#include "core/shared/types.h"

#include <QString>

namespace tp {

// ContextDiscretizer -- maps continuous readings onto the bandit's context key.
//
// Each temperature is matched against an ordered table of half-open
// [min, max) ranges. Readings below the first range clamp to the first
// band, readings at or above the last range (and NaN) clamp to the last
// band, so every real input resolves to a label.
class ContextDiscretizer {
public:
    static OutdoorBand outdoorBand(double outdoorTemp);
    static TargetBand targetBand(double targetTemp);

    static ContextKey discretize(double outdoorTemp,
                                 double targetTemp,
                                 const QString& roomCategory);
    static ContextKey discretize(double outdoorTemp,
                                 double targetTemp,
                                 RoomCategory roomCategory);
};

} // namespace tp
