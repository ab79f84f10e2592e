#include "core/learning/exploration_schedule.h"

#include <algorithm>
#include <cmath>

namespace tp {

ExplorationSchedule::ExplorationSchedule(Config config)
    : m_config(config)
    , m_epsilon(config.initial)
{
}

double ExplorationSchedule::epsilon() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_epsilon;
}

double ExplorationSchedule::decay()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_epsilon = std::max(m_config.floor, m_epsilon * m_config.decay);
    return m_epsilon;
}

void ExplorationSchedule::reset()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_epsilon = m_config.initial;
}

void ExplorationSchedule::restore(double epsilon)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!std::isfinite(epsilon)) {
        m_epsilon = m_config.initial;
        return;
    }
    m_epsilon = std::clamp(epsilon, m_config.floor, 1.0);
}

} // namespace tp
