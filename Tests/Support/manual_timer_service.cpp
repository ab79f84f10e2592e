#include "manual_timer_service.h"

namespace tp::test {

ManualTimerService::ManualTimerService()
    : m_now(Clock::time_point() + std::chrono::hours(24))
{
}

TimerToken ManualTimerService::schedule(std::chrono::milliseconds delay, Callback callback)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const uint64_t id = m_nextId++;
    auto it = m_queue.emplace(m_now + delay, Entry{id, std::move(callback)});
    m_index.emplace(id, it);
    return TimerToken{id};
}

bool ManualTimerService::cancel(TimerToken token)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_index.find(token.id);
    if (it == m_index.end()) {
        return false;
    }
    m_queue.erase(it->second);
    m_index.erase(it);
    return true;
}

TimerService::Clock::time_point ManualTimerService::now() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_now;
}

bool ManualTimerService::popDue(Clock::time_point limit, Callback* out)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_queue.empty() || m_queue.begin()->first > limit) {
        return false;
    }
    auto it = m_queue.begin();
    if (it->first > m_now) {
        m_now = it->first;
    }
    *out = std::move(it->second.callback);
    m_index.erase(it->second.id);
    m_queue.erase(it);
    return true;
}

int ManualTimerService::advance(std::chrono::milliseconds delta)
{
    Clock::time_point target;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        target = m_now + delta;
    }

    int fired = 0;
    Callback callback;
    while (popDue(target, &callback)) {
        callback();
        ++fired;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    if (target > m_now) {
        m_now = target;
    }
    return fired;
}

int ManualTimerService::fireAll()
{
    int fired = 0;
    Callback callback;
    while (popDue(Clock::time_point::max(), &callback)) {
        callback();
        ++fired;
    }
    return fired;
}

TimerService::Callback ManualTimerService::takeDue(std::chrono::milliseconds delta)
{
    Clock::time_point target;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        target = m_now + delta;
    }

    Callback callback;
    popDue(target, &callback);

    std::lock_guard<std::mutex> lock(m_mutex);
    if (target > m_now) {
        m_now = target;
    }
    return callback;
}

size_t ManualTimerService::pendingCount() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_queue.size();
}

} // namespace tp::test
