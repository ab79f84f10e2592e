#pragma once

#include <mutex>

namespace tp {

struct ExplorationScheduleConfig {
    double initial = 0.1;
    double floor = 0.01;
    double decay = 0.995;
};

// Process-wide exploration rate shared by every entity. Decays
// multiplicatively once per applied reward and never drops below the floor.
class ExplorationSchedule {
public:
    using Config = ExplorationScheduleConfig;

    explicit ExplorationSchedule(Config config = {});

    double epsilon() const;

    // Returns the value after decaying.
    double decay();

    // Back to the configured initial rate.
    void reset();

    // Used when restoring persisted state; clamped to [floor, 1].
    void restore(double epsilon);

    const Config& config() const { return m_config; }

private:
    Config m_config;
    mutable std::mutex m_mutex;
    double m_epsilon = 0.1;
};

} // namespace tp
