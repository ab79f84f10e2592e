#pragma once

#include "core/feedback/timer_service.h"

#include <condition_variable>
#include <map>
#include <mutex>
#include <thread>
#include <unordered_map>

namespace tp {

// DeadlineTimerService -- TimerService backed by one worker thread that
// sleeps until the earliest deadline.
//
// Callbacks run on the worker thread, one at a time, after the internal lock
// has been released. shutdown() drops pending timers and joins the worker;
// it is called from the destructor.
class DeadlineTimerService final : public TimerService {
public:
    DeadlineTimerService();
    ~DeadlineTimerService() override;

    DeadlineTimerService(const DeadlineTimerService&) = delete;
    DeadlineTimerService& operator=(const DeadlineTimerService&) = delete;

    TimerToken schedule(std::chrono::milliseconds delay, Callback callback) override;
    bool cancel(TimerToken token) override;
    Clock::time_point now() const override;

    void shutdown();
    size_t pendingCount() const;

private:
    using Queue = std::multimap<Clock::time_point, std::pair<uint64_t, Callback>>;

    void run();

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    Queue m_queue;
    std::unordered_map<uint64_t, Queue::iterator> m_index;
    uint64_t m_nextId = 1;
    bool m_shutdown = false;
    std::thread m_worker;
};

} // namespace tp
