#pragma once

#include "core/learning/learning_state.h"

#include <QString>

namespace tp {

// Durable home of learning snapshots. Implementations report failure through
// the return value and errorOut; they never throw.
class SnapshotStore {
public:
    virtual ~SnapshotStore() = default;

    // A store with nothing saved yields an empty snapshot and returns true.
    virtual bool load(LearningSnapshot* out, QString* errorOut) = 0;

    // Replaces whatever was stored before.
    virtual bool save(const LearningSnapshot& snapshot, QString* errorOut) = 0;
};

} // namespace tp
