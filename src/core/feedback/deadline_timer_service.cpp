#include "core/feedback/deadline_timer_service.h"
#include "core/shared/logging.h"

#include <algorithm>
#include <exception>

namespace tp {

DeadlineTimerService::DeadlineTimerService()
    : m_worker([this] { run(); })
{
}

DeadlineTimerService::~DeadlineTimerService()
{
    shutdown();
}

TimerToken DeadlineTimerService::schedule(std::chrono::milliseconds delay, Callback callback)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_shutdown) {
        LOG_WARN(tpFeedback, "DeadlineTimerService::schedule() called after shutdown");
        return {};
    }

    const uint64_t id = m_nextId++;
    const Clock::time_point deadline = Clock::now() + std::max(delay, std::chrono::milliseconds(0));
    auto it = m_queue.emplace(deadline, std::make_pair(id, std::move(callback)));
    m_index.emplace(id, it);

    // Only a new earliest deadline changes how long the worker should sleep.
    if (it == m_queue.begin()) {
        m_cv.notify_one();
    }
    return TimerToken{id};
}

bool DeadlineTimerService::cancel(TimerToken token)
{
    if (!token.isValid()) {
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    auto indexIt = m_index.find(token.id);
    if (indexIt == m_index.end()) {
        return false;
    }
    m_queue.erase(indexIt->second);
    m_index.erase(indexIt);
    m_cv.notify_one();
    return true;
}

TimerService::Clock::time_point DeadlineTimerService::now() const
{
    return Clock::now();
}

void DeadlineTimerService::shutdown()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_shutdown) {
            return;
        }
        m_shutdown = true;
        if (!m_queue.empty()) {
            LOG_INFO(tpFeedback, "DeadlineTimerService shutting down with %d pending timer(s)",
                     static_cast<int>(m_queue.size()));
        }
        m_queue.clear();
        m_index.clear();
        m_cv.notify_all();
    }
    if (m_worker.joinable() && m_worker.get_id() != std::this_thread::get_id()) {
        m_worker.join();
    }
}

size_t DeadlineTimerService::pendingCount() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_queue.size();
}

void DeadlineTimerService::run()
{
    std::unique_lock<std::mutex> lock(m_mutex);
    while (!m_shutdown) {
        if (m_queue.empty()) {
            m_cv.wait(lock, [this] { return m_shutdown || !m_queue.empty(); });
            continue;
        }

        const Clock::time_point deadline = m_queue.begin()->first;
        if (Clock::now() < deadline) {
            m_cv.wait_until(lock, deadline);
            continue;
        }

        auto it = m_queue.begin();
        Callback callback = std::move(it->second.second);
        m_index.erase(it->second.first);
        m_queue.erase(it);

        lock.unlock();
        try {
            callback();
        } catch (const std::exception& e) {
            LOG_ERROR(tpFeedback, "Timer callback threw: %s", e.what());
        }
        lock.lock();
    }
}

} // namespace tp
