#pragma once

#include "core/feedback/timer_service.h"

#include <map>
#include <mutex>
#include <unordered_map>

namespace tp::test {

// Timer service driven by the test. Time only moves through advance(); due
// callbacks run on the calling thread, in deadline order, without the
// internal lock held.
class ManualTimerService final : public TimerService {
public:
    ManualTimerService();

    TimerToken schedule(std::chrono::milliseconds delay, Callback callback) override;
    bool cancel(TimerToken token) override;
    Clock::time_point now() const override;

    // Moves the clock forward and fires everything due. Returns the number
    // of callbacks run.
    int advance(std::chrono::milliseconds delta);

    // Fires every pending timer regardless of its deadline.
    int fireAll();

    // Moves the clock forward and hands back the earliest callback due by
    // then without running it, so the test decides when a fired timer
    // reaches its target. Empty if nothing is due.
    Callback takeDue(std::chrono::milliseconds delta);

    size_t pendingCount() const;

private:
    struct Entry {
        uint64_t id = 0;
        Callback callback;
    };
    using Queue = std::multimap<Clock::time_point, Entry>;

    bool popDue(Clock::time_point limit, Callback* out);

    mutable std::mutex m_mutex;
    Clock::time_point m_now;
    Queue m_queue;
    std::unordered_map<uint64_t, Queue::iterator> m_index;
    uint64_t m_nextId = 1;
};

} // namespace tp::test
