#pragma once

#include "core/learning/learning_state.h"
#include "core/store/snapshot_store.h"

#include <QString>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>

namespace tp {

// PersistenceGateway -- asynchronous writer in front of a SnapshotStore.
//
// save() only enqueues; a dedicated worker thread performs the write, so the
// recommendation path never waits on disk I/O. A failed write is retried
// with exponential backoff. A snapshot is dropped once it has used all of
// its attempts, or as soon as a newer snapshot is queued behind it (the
// newer one carries strictly more state).
//
// Backpressure: at most kMaxQueueSize snapshots wait; the oldest is evicted
// to make room.
class PersistenceGateway {
public:
    static constexpr size_t kMaxQueueSize = 16;

    struct RetryPolicy {
        int maxAttempts = 3;
        std::chrono::milliseconds initialBackoff{1000};
        std::chrono::milliseconds maxBackoff{30000};
    };

    struct Stats {
        uint64_t saved = 0;
        uint64_t failedAttempts = 0;
        uint64_t dropped = 0;      // retries exhausted
        uint64_t superseded = 0;   // failed with a newer snapshot queued
        uint64_t evicted = 0;      // pushed out by the queue bound
        size_t pending = 0;
        QString lastError;
    };

    explicit PersistenceGateway(std::unique_ptr<SnapshotStore> store);
    PersistenceGateway(std::unique_ptr<SnapshotStore> store, RetryPolicy policy);
    ~PersistenceGateway();

    // Non-copyable, non-movable
    PersistenceGateway(const PersistenceGateway&) = delete;
    PersistenceGateway& operator=(const PersistenceGateway&) = delete;
    PersistenceGateway(PersistenceGateway&&) = delete;
    PersistenceGateway& operator=(PersistenceGateway&&) = delete;

    // Synchronous. A failed read is logged and yields an empty snapshot.
    LearningSnapshot load();

    // Returns false only after shutdown().
    bool save(LearningSnapshot snapshot);

    // Blocks until every queued snapshot has been written or dropped.
    // Returns false on timeout.
    bool flush(std::chrono::milliseconds timeout);

    // Makes one last attempt at the newest queued snapshot, then stops the
    // worker. Idempotent.
    void shutdown();

    Stats stats() const;
    const RetryPolicy& retryPolicy() const { return m_policy; }

    // Delay before retry number `attempt` (1-based count of failures so far).
    static std::chrono::milliseconds backoffDelay(int attempt, const RetryPolicy& policy);

private:
    struct PendingSnapshot {
        LearningSnapshot snapshot;
        int attempts = 0;
    };

    void workerLoop();
    bool write(PendingSnapshot& pending);

    std::unique_ptr<SnapshotStore> m_store;
    RetryPolicy m_policy;

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::condition_variable m_idleCv;
    std::deque<PendingSnapshot> m_queue;
    bool m_busy = false;
    bool m_shutdown = false;
    Stats m_stats;

    std::thread m_worker;
};

} // namespace tp
