#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace tp {

// Handle returned by TimerService::schedule(). A default-constructed token
// refers to no timer.
struct TimerToken {
    uint64_t id = 0;

    bool isValid() const { return id != 0; }
};

inline bool operator==(TimerToken a, TimerToken b) { return a.id == b.id; }
inline bool operator!=(TimerToken a, TimerToken b) { return a.id != b.id; }

// Cancellable one-shot timers. Callbacks may run on a thread owned by the
// implementation; they are never invoked with internal locks held.
class TimerService {
public:
    using Clock = std::chrono::steady_clock;
    using Callback = std::function<void()>;

    virtual ~TimerService() = default;

    virtual TimerToken schedule(std::chrono::milliseconds delay, Callback callback) = 0;

    // Returns true if the timer was pending and will not fire. False when it
    // already fired, is firing, or was never scheduled.
    virtual bool cancel(TimerToken token) = 0;

    virtual Clock::time_point now() const = 0;
};

} // namespace tp
