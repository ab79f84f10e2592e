#include "core/feedback/reward_scheduler.h"
#include "core/feedback/activity_logger.h"
#include "core/shared/logging.h"

#include <QDateTime>

#include <exception>
#include <utility>
#include <vector>

namespace tp {

QString windowStateToString(WindowState state)
{
    switch (state) {
    case WindowState::Active:             return QStringLiteral("active");
    case WindowState::ResolvedAccepted:   return QStringLiteral("accepted");
    case WindowState::ResolvedOverridden: return QStringLiteral("overridden");
    case WindowState::Cancelled:          return QStringLiteral("cancelled");
    }
    return QStringLiteral("unknown");
}

MonitoringWindow::MonitoringWindow(uint64_t id,
                                   Recommendation recommendation,
                                   TimerService::Clock::time_point armedAt,
                                   TimerService::Clock::time_point deadline)
    : m_id(id)
    , m_recommendation(std::move(recommendation))
    , m_armedAt(armedAt)
    , m_deadline(deadline)
{
}

bool MonitoringWindow::claim(WindowState resolution)
{
    WindowState expected = WindowState::Active;
    return m_state.compare_exchange_strong(expected, resolution);
}

RewardScheduler::RewardScheduler(LearningStateStore& store,
                                 TimerService& timers,
                                 ActivityLogger* logger,
                                 Config config)
    : m_store(store)
    , m_timers(timers)
    , m_logger(logger)
    , m_config(config)
    , m_gate(std::make_shared<CallbackGate>())
{
}

RewardScheduler::RewardScheduler(LearningStateStore& store, TimerService& timers, ActivityLogger* logger)
    : RewardScheduler(store, timers, logger, Config())
{
}

RewardScheduler::~RewardScheduler()
{
    {
        std::unique_lock<std::mutex> lock(m_gate->mutex);
        m_gate->open = false;
        m_gate->idle.wait(lock, [this] { return m_gate->inFlight == 0; });
    }

    std::vector<std::pair<std::shared_ptr<MonitoringWindow>, TimerToken>> remaining;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& window : std::as_const(m_windows)) {
            if (window->claim(WindowState::Cancelled)) {
                remaining.emplace_back(window, window->m_token);
            }
        }
        m_windows.clear();
    }
    for (const auto& [window, token] : remaining) {
        retire(window, token, false, false);
    }
}

void RewardScheduler::setResolutionHandler(ResolutionHandler handler)
{
    m_handler = std::move(handler);
}

std::shared_ptr<const MonitoringWindow> RewardScheduler::arm(const QString& entityId,
                                                             const Recommendation& recommendation)
{
    if (entityId.isEmpty()) {
        LOG_WARN(tpFeedback, "Refusing to arm a monitoring window without an entity id");
        return nullptr;
    }

    std::shared_ptr<MonitoringWindow> previous;
    TimerToken previousToken;
    std::shared_ptr<MonitoringWindow> window;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::shared_ptr<MonitoringWindow> replaced = m_windows.take(entityId);
        if (replaced && replaced->claim(WindowState::Cancelled)) {
            previous = std::move(replaced);
            previousToken = previous->m_token;
        }

        Recommendation pending = recommendation;
        pending.entityId = entityId;
        const TimerService::Clock::time_point armedAt = m_timers.now();
        window = std::make_shared<MonitoringWindow>(m_nextWindowId++,
                                                    std::move(pending),
                                                    armedAt,
                                                    armedAt + m_config.windowDuration);
        m_windows.insert(entityId, window);

        std::weak_ptr<MonitoringWindow> weakWindow = window;
        window->m_token = m_timers.schedule(
            m_config.windowDuration,
            [this, gate = m_gate, weakWindow]() {
                {
                    std::lock_guard<std::mutex> gateLock(gate->mutex);
                    if (!gate->open) {
                        return;
                    }
                    ++gate->inFlight;
                }
                onDeadline(weakWindow);
                std::lock_guard<std::mutex> gateLock(gate->mutex);
                --gate->inFlight;
                gate->idle.notify_all();
            });
    }

    if (previous) {
        retire(previous, previousToken, true, true);
        LOG_INFO(tpFeedback, "Superseded monitoring window %llu for '%s' without reward",
                 static_cast<unsigned long long>(previous->id()), qUtf8Printable(entityId));
    }

    ++m_armed;
    LOG_INFO(tpFeedback, "Armed monitoring window %llu for '%s' (%lld ms, %s -> %.1f)",
             static_cast<unsigned long long>(window->id()),
             qUtf8Printable(entityId),
             static_cast<long long>(m_config.windowDuration.count()),
             qUtf8Printable(actionToString(recommendation.action)),
             recommendation.recommendedTemp);
    return window;
}

bool RewardScheduler::onManualAdjustment(const QString& entityId,
                                         double newTemp,
                                         double previousTemp,
                                         const QString& changedBy)
{
    std::shared_ptr<MonitoringWindow> window;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        window = m_windows.value(entityId);
    }
    if (!window) {
        LOG_DEBUG(tpFeedback, "Manual change for '%s' outside any monitoring window",
                  qUtf8Printable(entityId));
        return false;
    }

    const std::optional<TimerToken> token = beginResolution(window, WindowState::ResolvedOverridden);
    if (!token) {
        LOG_DEBUG(tpFeedback, "Window %llu for '%s' already resolved as %s",
                  static_cast<unsigned long long>(window->id()),
                  qUtf8Printable(entityId),
                  qUtf8Printable(windowStateToString(window->state())));
        return false;
    }

    m_timers.cancel(*token);
    ++m_overridden;

    WindowResolution resolution;
    try {
        resolution = applyReward(window, WindowState::ResolvedOverridden, m_config.overrideReward);
        logOverride(window, resolution, newTemp, previousTemp, changedBy);
    } catch (const std::exception&) {
        endResolution(entityId);
        throw;
    }

    endResolution(entityId);
    notify(resolution);
    return true;
}

void RewardScheduler::logOverride(const std::shared_ptr<MonitoringWindow>& window,
                                  const WindowResolution& resolution,
                                  double newTemp,
                                  double previousTemp,
                                  const QString& changedBy)
{
    const QString& entityId = window->entityId();
    LOG_INFO(tpFeedback, "Manual override for '%s' after %lld ms; reward %.2f applied",
             qUtf8Printable(entityId),
             static_cast<long long>(resolution.elapsedMs),
             m_config.overrideReward);

    if (m_logger) {
        ManualAdjustmentRecord record;
        record.entityId = entityId;
        record.recommendedTemp = window->recommendation().recommendedTemp;
        record.adjustedTemp = newTemp;
        record.previousTemp = previousTemp;
        record.adjustmentTimeMs = resolution.elapsedMs;
        record.changedBy = changedBy.isEmpty() ? QStringLiteral("user") : changedBy;
        record.context = window->recommendation().context;
        record.timestamp = QDateTime::currentDateTimeUtc();
        m_logger->logManualAdjustment(record);
    }
}

void RewardScheduler::onDeadline(const std::weak_ptr<MonitoringWindow>& weakWindow)
{
    std::shared_ptr<MonitoringWindow> window = weakWindow.lock();
    if (!window) {
        return;
    }

    if (!beginResolution(window, WindowState::ResolvedAccepted)) {
        LOG_DEBUG(tpFeedback, "Deadline for window %llu lost to %s",
                  static_cast<unsigned long long>(window->id()),
                  qUtf8Printable(windowStateToString(window->state())));
        return;
    }
    ++m_accepted;

    WindowResolution resolution;
    bool resolved = false;
    try {
        resolution = applyReward(window, WindowState::ResolvedAccepted, m_config.sustainedReward);
        resolved = true;
        LOG_INFO(tpFeedback, "Recommendation sustained for '%s'; reward %.2f applied",
                 qUtf8Printable(window->entityId()), m_config.sustainedReward);

        if (m_logger) {
            SuccessfulRecommendationRecord record;
            record.entityId = window->entityId();
            record.recommendation = window->recommendation();
            record.sustainedDurationMs = resolution.elapsedMs;
            record.timestamp = QDateTime::currentDateTimeUtc();
            m_logger->logSuccessfulRecommendation(record);
        }
    } catch (const std::exception& e) {
        LOG_ERROR(tpFeedback, "Failed to resolve window %llu for '%s': %s",
                  static_cast<unsigned long long>(window->id()),
                  qUtf8Printable(window->entityId()),
                  e.what());
    }

    endResolution(window->entityId());
    if (resolved) {
        notify(resolution);
    }
}

std::optional<TimerToken> RewardScheduler::beginResolution(const std::shared_ptr<MonitoringWindow>& window,
                                                           WindowState outcome)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!window->claim(outcome)) {
        return std::nullopt;
    }
    detachLocked(window);
    ++m_resolving[window->entityId()];
    return window->m_token;
}

void RewardScheduler::endResolution(const QString& entityId)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_resolving.find(entityId);
        if (it != m_resolving.end() && --it.value() <= 0) {
            m_resolving.erase(it);
        }
    }
    m_resolved.notify_all();
}

void RewardScheduler::waitForResolutionLocked(std::unique_lock<std::mutex>& lock, const QString& entityId)
{
    m_resolved.wait(lock, [this, &entityId] { return !m_resolving.contains(entityId); });
}

bool RewardScheduler::cancel(const QString& entityId)
{
    std::shared_ptr<MonitoringWindow> window;
    TimerToken token;
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        window = m_windows.take(entityId);
        if (window && window->claim(WindowState::Cancelled)) {
            token = window->m_token;
        } else {
            window.reset();
        }
        waitForResolutionLocked(lock, entityId);
    }
    if (!window) {
        return false;
    }
    retire(window, token, false, true);
    return true;
}

int RewardScheduler::cancelAll()
{
    std::vector<std::pair<std::shared_ptr<MonitoringWindow>, TimerToken>> windows;
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        windows.reserve(static_cast<size_t>(m_windows.size()));
        for (const auto& window : std::as_const(m_windows)) {
            if (window->claim(WindowState::Cancelled)) {
                windows.emplace_back(window, window->m_token);
            }
        }
        m_windows.clear();
        m_resolved.wait(lock, [this] { return m_resolving.isEmpty(); });
    }

    for (const auto& [window, token] : windows) {
        retire(window, token, false, true);
    }
    const int cancelled = static_cast<int>(windows.size());
    if (cancelled > 0) {
        LOG_INFO(tpFeedback, "Cancelled %d monitoring window(s)", cancelled);
    }
    return cancelled;
}

void RewardScheduler::retire(const std::shared_ptr<MonitoringWindow>& window,
                             TimerToken token,
                             bool superseded,
                             bool notifyHandler)
{
    m_timers.cancel(token);
    if (superseded) {
        ++m_superseded;
    } else {
        ++m_cancelled;
    }

    if (notifyHandler) {
        WindowResolution resolution;
        resolution.entityId = window->entityId();
        resolution.windowId = window->id();
        resolution.outcome = WindowState::Cancelled;
        resolution.superseded = superseded;
        resolution.elapsedMs = elapsedMs(*window);
        resolution.recommendation = window->recommendation();
        notify(resolution);
    }
}

void RewardScheduler::detachLocked(const std::shared_ptr<MonitoringWindow>& window)
{
    auto it = m_windows.find(window->entityId());
    if (it != m_windows.end() && it.value() == window) {
        m_windows.erase(it);
    }
}

WindowResolution RewardScheduler::applyReward(const std::shared_ptr<MonitoringWindow>& window,
                                              WindowState outcome,
                                              double reward)
{
    WindowResolution resolution;
    resolution.entityId = window->entityId();
    resolution.windowId = window->id();
    resolution.outcome = outcome;
    resolution.reward = reward;
    resolution.elapsedMs = elapsedMs(*window);
    resolution.recommendation = window->recommendation();

    const Recommendation& rec = window->recommendation();
    const auto update = m_store.update(rec.entityId, rec.context, rec.action, reward);
    if (update.has_value()) {
        resolution.rewardApplied = true;
        resolution.previousQ = update->previousQ;
        resolution.newQ = update->newQ;
    } else {
        LOG_WARN(tpFeedback, "Reward for window %llu of '%s' was rejected by the store",
                 static_cast<unsigned long long>(window->id()), qUtf8Printable(rec.entityId));
    }
    return resolution;
}

void RewardScheduler::notify(const WindowResolution& resolution)
{
    if (m_handler) {
        m_handler(resolution);
    }
}

int64_t RewardScheduler::elapsedMs(const MonitoringWindow& window) const
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        m_timers.now() - window.armedAt()).count();
}

bool RewardScheduler::hasActiveWindow(const QString& entityId) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto window = m_windows.value(entityId);
    return window && window->isActive();
}

std::shared_ptr<const MonitoringWindow> RewardScheduler::activeWindow(const QString& entityId) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto window = m_windows.value(entityId);
    if (!window || !window->isActive()) {
        return nullptr;
    }
    return window;
}

int RewardScheduler::activeWindowCount() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    int count = 0;
    for (const auto& window : m_windows) {
        if (window->isActive()) {
            ++count;
        }
    }
    return count;
}

RewardScheduler::Counters RewardScheduler::counters() const
{
    Counters out;
    out.armed = m_armed.load();
    out.accepted = m_accepted.load();
    out.overridden = m_overridden.load();
    out.superseded = m_superseded.load();
    out.cancelled = m_cancelled.load();
    return out;
}

} // namespace tp
