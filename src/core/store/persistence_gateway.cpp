#include "core/store/persistence_gateway.h"
#include "core/shared/logging.h"

#include <algorithm>
#include <utility>

namespace tp {

PersistenceGateway::PersistenceGateway(std::unique_ptr<SnapshotStore> store)
    : PersistenceGateway(std::move(store), RetryPolicy())
{
}

PersistenceGateway::PersistenceGateway(std::unique_ptr<SnapshotStore> store, RetryPolicy policy)
    : m_store(std::move(store))
    , m_policy(policy)
{
    m_policy.maxAttempts = std::max(1, m_policy.maxAttempts);
    m_worker = std::thread(&PersistenceGateway::workerLoop, this);
}

PersistenceGateway::~PersistenceGateway()
{
    shutdown();
}

LearningSnapshot PersistenceGateway::load()
{
    LearningSnapshot snapshot;
    if (!m_store) {
        LOG_WARN(tpStore, "No snapshot store configured; starting with empty learning state");
        return snapshot;
    }

    QString error;
    if (!m_store->load(&snapshot, &error)) {
        LOG_WARN(tpStore, "Failed to load learning snapshot (%s); starting empty",
                 qUtf8Printable(error));
        return LearningSnapshot();
    }
    return snapshot;
}

bool PersistenceGateway::save(LearningSnapshot snapshot)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_shutdown) {
            LOG_WARN(tpStore, "Snapshot save requested after shutdown; ignored");
            return false;
        }
        if (m_queue.size() >= kMaxQueueSize) {
            m_queue.pop_front();
            ++m_stats.evicted;
            LOG_WARN(tpStore, "Persistence queue full; evicted oldest snapshot");
        }
        PendingSnapshot pending;
        pending.snapshot = std::move(snapshot);
        m_queue.push_back(std::move(pending));
    }
    m_cv.notify_all();
    return true;
}

bool PersistenceGateway::flush(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_idleCv.wait_for(lock, timeout, [this] {
        return m_queue.empty() && !m_busy;
    });
}

void PersistenceGateway::shutdown()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_shutdown = true;
    }
    m_cv.notify_all();
    if (m_worker.joinable()) {
        m_worker.join();
    }
}

PersistenceGateway::Stats PersistenceGateway::stats() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    Stats out = m_stats;
    out.pending = m_queue.size() + (m_busy ? 1 : 0);
    return out;
}

std::chrono::milliseconds PersistenceGateway::backoffDelay(int attempt, const RetryPolicy& policy)
{
    auto delay = policy.initialBackoff;
    for (int i = 1; i < attempt && delay < policy.maxBackoff; ++i) {
        delay *= 2;
    }
    return std::min(delay, policy.maxBackoff);
}

bool PersistenceGateway::write(PendingSnapshot& pending)
{
    ++pending.attempts;
    if (!m_store) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stats.lastError = QStringLiteral("no snapshot store");
        return false;
    }

    QString error;
    const bool ok = m_store->save(pending.snapshot, &error);
    if (!ok) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stats.lastError = error;
    }
    return ok;
}

void PersistenceGateway::workerLoop()
{
    std::unique_lock<std::mutex> lock(m_mutex);
    while (true) {
        m_cv.wait(lock, [this] { return m_shutdown || !m_queue.empty(); });

        if (m_shutdown) {
            if (!m_queue.empty()) {
                // Only the newest snapshot matters for the final write.
                m_stats.superseded += m_queue.size() - 1;
                PendingSnapshot last = std::move(m_queue.back());
                m_queue.clear();
                m_busy = true;
                lock.unlock();
                const bool ok = write(last);
                lock.lock();
                if (ok) {
                    ++m_stats.saved;
                } else {
                    ++m_stats.failedAttempts;
                    ++m_stats.dropped;
                    LOG_WARN(tpStore, "Final snapshot write failed during shutdown; learning "
                                      "progress since the last save is lost");
                }
            }
            m_busy = false;
            m_idleCv.notify_all();
            return;
        }

        PendingSnapshot pending = std::move(m_queue.front());
        m_queue.pop_front();
        m_busy = true;

        while (true) {
            lock.unlock();
            const bool ok = write(pending);
            lock.lock();

            if (ok) {
                ++m_stats.saved;
                LOG_DEBUG(tpStore, "Snapshot persisted after %d attempt(s)", pending.attempts);
                break;
            }

            ++m_stats.failedAttempts;
            if (!m_queue.empty()) {
                ++m_stats.superseded;
                LOG_INFO(tpStore, "Discarding failed snapshot; a newer one is queued");
                break;
            }
            if (pending.attempts >= m_policy.maxAttempts) {
                ++m_stats.dropped;
                LOG_WARN(tpStore, "Dropping snapshot after %d failed attempts: %s",
                         pending.attempts, qUtf8Printable(m_stats.lastError));
                break;
            }

            const auto delay = backoffDelay(pending.attempts, m_policy);
            LOG_INFO(tpStore, "Snapshot write failed (attempt %d/%d); retrying in %lld ms",
                     pending.attempts, m_policy.maxAttempts,
                     static_cast<long long>(delay.count()));
            m_cv.wait_for(lock, delay, [this] { return m_shutdown || !m_queue.empty(); });

            if (!m_queue.empty()) {
                ++m_stats.superseded;
                LOG_INFO(tpStore, "Abandoning retry; a newer snapshot is queued");
                break;
            }
            if (m_shutdown) {
                // Hand the snapshot to the shutdown branch for its last attempt.
                m_queue.push_back(std::move(pending));
                break;
            }
        }

        m_busy = false;
        if (m_queue.empty()) {
            m_idleCv.notify_all();
        }
    }
}

} // namespace tp
