#pragma once

#include <progressengine/core/cache/cache_client.hpp>
#include <progressengine/core/metrics/registry.hpp>
#include <progressengine/core/storage/snapshot_store.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

namespace ProgressEngine {

struct SyncerOptions {
    std::chrono::milliseconds interval{std::chrono::seconds(30)};
    size_t batchSize = 100;
    std::chrono::milliseconds leaseTtl{std::chrono::seconds(30)};
    std::string owner = "snapshot-syncer";
    bool finalSyncOnStop = true;
};

struct SyncStats {
    size_t synced = 0;    // upserted and marker cleared
    size_t failed = 0;    // left dirty for the next cycle
    size_t skipped = 0;   // changed during the upsert, or nothing left to write
    bool leaseHeld = false;
};

/**
 * @class SnapshotSyncer
 * @brief Background write-back of dirty progress keys to the durable store.
 *
 * Each cycle takes the sync lease, pops up to batchSize dirty markers and
 * upserts the current cache state of every key. A marker is cleared only if
 * its generation is unchanged, so a write that lands mid-sync stays dirty.
 * A failed key is logged and retried next cycle; it never fails the batch.
 *
 * stop() interrupts a running batch between keys, then runs one final
 * uninterrupted sync on the calling thread.
 */
class SnapshotSyncer {
public:
    static constexpr const char* LEASE_NAME = "lock:progress_sync";

    SnapshotSyncer(CacheClient& cache, SnapshotStore& store, SyncerOptions options = {});
    ~SnapshotSyncer() noexcept;

    SnapshotSyncer(const SnapshotSyncer&) = delete;
    SnapshotSyncer& operator=(const SnapshotSyncer&) = delete;

    void start();
    void stop();
    bool isRunning() const { return running_.load(std::memory_order_acquire); }

    /// One sync cycle. Safe to call from any thread; the lease serialises runs.
    SyncStats syncPending();

    /// Makes an in-flight syncPending() return after the current key.
    void interrupt() { interrupt_.store(true, std::memory_order_release); }

private:
    void loop();
    enum class KeyOutcome { SYNCED, FAILED, SKIPPED };
    KeyOutcome syncKey(const CacheClient::DirtyEntry& entry);
    void reportHealth(const SyncStats& stats);

    CacheClient& cache_;
    SnapshotStore& store_;
    SyncerOptions options_;

    std::atomic<bool> running_{false};
    std::atomic<bool> interrupt_{false};
    std::thread worker_thread_;
    int consecutive_failed_cycles_ = 0;  // loop thread only
    std::mutex cycle_mutex_;

    // For interruptible sleep during shutdown
    mutable std::mutex sleep_mutex_;
    std::condition_variable sleep_cv_;
};

} // namespace ProgressEngine
