#pragma once

#include "core/feedback/timer_service.h"
#include "core/learning/learning_state_store.h"
#include "core/shared/recommendation.h"

#include <QHash>
#include <QString>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>

namespace tp {

class ActivityLogger;

// Active → ResolvedAccepted | ResolvedOverridden | Cancelled. All but Active
// are terminal.
enum class WindowState : int {
    Active,
    ResolvedAccepted,
    ResolvedOverridden,
    Cancelled,
};

QString windowStateToString(WindowState state);

class MonitoringWindow {
public:
    MonitoringWindow(uint64_t id,
                     Recommendation recommendation,
                     TimerService::Clock::time_point armedAt,
                     TimerService::Clock::time_point deadline);

    uint64_t id() const { return m_id; }
    const QString& entityId() const { return m_recommendation.entityId; }
    const Recommendation& recommendation() const { return m_recommendation; }
    TimerService::Clock::time_point armedAt() const { return m_armedAt; }
    TimerService::Clock::time_point deadline() const { return m_deadline; }
    WindowState state() const { return m_state.load(); }
    bool isActive() const { return state() == WindowState::Active; }

private:
    friend class RewardScheduler;

    // Compare-and-set from Active. Exactly one caller ever wins.
    bool claim(WindowState resolution);

    const uint64_t m_id;
    const Recommendation m_recommendation;
    const TimerService::Clock::time_point m_armedAt;
    const TimerService::Clock::time_point m_deadline;
    std::atomic<WindowState> m_state{WindowState::Active};
    TimerToken m_token;  // guarded by RewardScheduler::m_mutex
};

struct WindowResolution {
    QString entityId;
    uint64_t windowId = 0;
    WindowState outcome = WindowState::Cancelled;
    bool superseded = false;
    double reward = 0.0;
    bool rewardApplied = false;
    double previousQ = 0.0;
    double newQ = 0.0;
    int64_t elapsedMs = 0;
    Recommendation recommendation;
};

// RewardScheduler -- delayed-reward attribution for accepted recommendations.
//
// Each entity has at most one active monitoring window. The countdown path
// and the manual-adjustment path race to claim the window; the claim is a
// compare-and-set on the window state, so exactly one of them applies a
// reward. Re-arming an entity supersedes (cancels, no reward) its previous
// window. Cancelled windows never apply a reward.
//
// Claims are taken under m_mutex. A claimed window stays marked as resolving
// until its reward is in the store, and cancel()/cancelAll() wait for that,
// so a reset that follows a cancel never sees the reward land afterwards.
class RewardScheduler {
public:
    struct Config {
        std::chrono::milliseconds windowDuration{60 * 60 * 1000};
        double sustainedReward = 0.5;
        double overrideReward = -0.5;
    };

    struct Counters {
        uint64_t armed = 0;
        uint64_t accepted = 0;
        uint64_t overridden = 0;
        uint64_t superseded = 0;
        uint64_t cancelled = 0;
    };

    using ResolutionHandler = std::function<void(const WindowResolution&)>;

    // logger may be null.
    RewardScheduler(LearningStateStore& store,
                    TimerService& timers,
                    ActivityLogger* logger,
                    Config config);
    RewardScheduler(LearningStateStore& store, TimerService& timers, ActivityLogger* logger);
    ~RewardScheduler();

    RewardScheduler(const RewardScheduler&) = delete;
    RewardScheduler& operator=(const RewardScheduler&) = delete;

    // Called for every terminal transition, from whichever thread resolved
    // the window. Set before arming.
    void setResolutionHandler(ResolutionHandler handler);

    std::shared_ptr<const MonitoringWindow> arm(const QString& entityId,
                                                const Recommendation& recommendation);

    // Returns true if this call resolved an active window.
    bool onManualAdjustment(const QString& entityId,
                            double newTemp,
                            double previousTemp,
                            const QString& changedBy);

    // Both wait for a resolution already in progress to finish writing its
    // reward. Neither may be called from the resolution handler's thread
    // while that resolution is running.
    bool cancel(const QString& entityId);
    int cancelAll();

    bool hasActiveWindow(const QString& entityId) const;
    std::shared_ptr<const MonitoringWindow> activeWindow(const QString& entityId) const;
    int activeWindowCount() const;
    Counters counters() const;
    const Config& config() const { return m_config; }

private:
    // Keeps timer callbacks from entering a scheduler that is being destroyed.
    // Shared with every scheduled callback so it outlives the scheduler.
    struct CallbackGate {
        std::mutex mutex;
        std::condition_variable idle;
        bool open = true;
        int inFlight = 0;
    };

    void onDeadline(const std::weak_ptr<MonitoringWindow>& weakWindow);

    // Claims the window for a reward-bearing outcome and marks its entity as
    // resolving. Returns the timer token to cancel, or nullopt if the claim
    // was lost.
    std::optional<TimerToken> beginResolution(const std::shared_ptr<MonitoringWindow>& window,
                                              WindowState outcome);
    void endResolution(const QString& entityId);
    void logOverride(const std::shared_ptr<MonitoringWindow>& window,
                     const WindowResolution& resolution,
                     double newTemp,
                     double previousTemp,
                     const QString& changedBy);
    // Requires m_mutex.
    void detachLocked(const std::shared_ptr<MonitoringWindow>& window);
    void waitForResolutionLocked(std::unique_lock<std::mutex>& lock, const QString& entityId);

    // The window must already be claimed as Cancelled.
    void retire(const std::shared_ptr<MonitoringWindow>& window,
                TimerToken token,
                bool superseded,
                bool notifyHandler);
    WindowResolution applyReward(const std::shared_ptr<MonitoringWindow>& window,
                                 WindowState outcome,
                                 double reward);
    void notify(const WindowResolution& resolution);
    int64_t elapsedMs(const MonitoringWindow& window) const;

    LearningStateStore& m_store;
    TimerService& m_timers;
    ActivityLogger* m_logger = nullptr;
    Config m_config;
    ResolutionHandler m_handler;

    std::shared_ptr<CallbackGate> m_gate;

    mutable std::mutex m_mutex;
    QHash<QString, std::shared_ptr<MonitoringWindow>> m_windows;
    QHash<QString, int> m_resolving;
    std::condition_variable m_resolved;
    uint64_t m_nextWindowId = 1;

    std::atomic<uint64_t> m_armed{0};
    std::atomic<uint64_t> m_accepted{0};
    std::atomic<uint64_t> m_overridden{0};
    std::atomic<uint64_t> m_superseded{0};
    std::atomic<uint64_t> m_cancelled{0};
};

} // namespace tp
