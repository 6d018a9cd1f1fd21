#include <progressengine/core/sync/snapshot_syncer.hpp>
#include <progressengine/core/cache/keys.hpp>
#include <progressengine/core/common/errors.hpp>
#include <progressengine/core/storage/snapshot_codec.hpp>
#include <progressengine/core/utils/clock.hpp>
#include <spdlog/spdlog.h>
#include <tuple>
#include <vector>

namespace ProgressEngine {

namespace {

// Releases the sync lease when the cycle ends, however it ends
class LeaseGuard {
public:
    LeaseGuard(CacheClient& cache, std::string name, std::string owner)
        : cache_(cache), name_(std::move(name)), owner_(std::move(owner)) {}
    ~LeaseGuard() {
        try {
            cache_.releaseLease(name_, owner_);
        } catch (const ProgressError& e) {
            // Lease expires on its own TTL
            spdlog::warn("[SnapshotSyncer] Could not release lease {}: {}", name_, e.what());
        }
    }
    LeaseGuard(const LeaseGuard&) = delete;
    LeaseGuard& operator=(const LeaseGuard&) = delete;

private:
    CacheClient& cache_;
    std::string name_;
    std::string owner_;
};

} // namespace

SnapshotSyncer::SnapshotSyncer(CacheClient& cache, SnapshotStore& store, SyncerOptions options)
    : cache_(cache), store_(store), options_(std::move(options)) {
    if (options_.batchSize == 0) options_.batchSize = 1;
    if (options_.leaseTtl > options_.interval) {
        spdlog::warn("[SnapshotSyncer] Lease TTL {}ms exceeds interval {}ms, clamping",
                     options_.leaseTtl.count(), options_.interval.count());
        options_.leaseTtl = options_.interval;
    }
    spdlog::info("[SnapshotSyncer] Initialized (interval: {}ms, batch: {}, owner: {})",
                 options_.interval.count(), options_.batchSize, options_.owner);
}

SnapshotSyncer::~SnapshotSyncer() noexcept {
    if (running_.load(std::memory_order_acquire)) {
        spdlog::info("[SnapshotSyncer] Shutting down...");
        try {
            stop();
        } catch (const std::exception& e) {
            spdlog::error("[SnapshotSyncer] Error during shutdown: {}", e.what());
        }
    }
}

void SnapshotSyncer::start() {
    if (running_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    worker_thread_ = std::thread(&SnapshotSyncer::loop, this);
    spdlog::info("[SnapshotSyncer] Started sync loop");
}

void SnapshotSyncer::stop() {
    bool wasRunning = running_.exchange(false, std::memory_order_acq_rel);
    interrupt_.store(true, std::memory_order_release);
    sleep_cv_.notify_all();  // Wake up sleeping thread immediately
    if (worker_thread_.joinable()) {
        worker_thread_.join();
    }
    if (wasRunning && options_.finalSyncOnStop) {
        auto stats = syncPending();
        spdlog::info("[SnapshotSyncer] Final sync: synced={} failed={} skipped={}",
                     stats.synced, stats.failed, stats.skipped);
    }
    spdlog::info("[SnapshotSyncer] Stopped");
}

void SnapshotSyncer::loop() {
    while (running_.load(std::memory_order_acquire)) {
        // Interruptible sleep: wait for the interval OR until stop() is called
        {
            std::unique_lock<std::mutex> lock(sleep_mutex_);
            sleep_cv_.wait_for(lock, options_.interval, [this]() {
                return !running_.load(std::memory_order_acquire);
            });
        }

        if (!running_.load(std::memory_order_acquire)) {
            break;
        }

        auto stats = syncPending();
        reportHealth(stats);
    }
}

SyncStats SnapshotSyncer::syncPending() {
    auto& metrics = MetricRegistry::getInstance().getMetrics(MetricNames::SNAPSHOT_SYNCER);
    ScopedLatency<Metrics> latency(metrics);
    metrics.total_sync_cycles.fetch_add(1, std::memory_order_relaxed);
    MetricRegistry::getInstance().touch(metrics);
    SyncStats stats;
    // The lease is re-entrant for one owner, so guard against our own threads too
    std::unique_lock<std::mutex> cycle(cycle_mutex_, std::try_to_lock);
    if (!cycle.owns_lock()) {
        spdlog::debug("[SnapshotSyncer] Cycle already running, skipping");
        return stats;
    }
    interrupt_.store(false, std::memory_order_release);

    try {
        if (!cache_.acquireLease(LEASE_NAME, options_.owner, options_.leaseTtl)) {
            spdlog::debug("[SnapshotSyncer] Lease held elsewhere, skipping cycle");
            return stats;
        }
    } catch (const ProgressError& e) {
        spdlog::warn("[SnapshotSyncer] Cannot take lease: {}", e.what());
        return stats;
    }
    stats.leaseHeld = true;
    LeaseGuard lease(cache_, LEASE_NAME, options_.owner);

    std::vector<CacheClient::DirtyEntry> batch;
    try {
        batch = cache_.dirtyBatch(options_.batchSize);
    } catch (const ProgressError& e) {
        spdlog::warn("[SnapshotSyncer] Cannot read dirty set: {}", e.what());
        return stats;
    }

    for (size_t i = 0; i < batch.size(); ++i) {
        if (interrupt_.load(std::memory_order_acquire)) {
            spdlog::info("[SnapshotSyncer] Interrupted, {} keys left dirty", batch.size() - i);
            break;
        }
        switch (syncKey(batch[i])) {
            case KeyOutcome::SYNCED:  ++stats.synced; break;
            case KeyOutcome::FAILED:  ++stats.failed; break;
            case KeyOutcome::SKIPPED: ++stats.skipped; break;
        }
    }

    metrics.total_operations.fetch_add(stats.synced, std::memory_order_relaxed);
    metrics.total_sync_failures.fetch_add(stats.failed, std::memory_order_relaxed);
    if (!batch.empty()) {
        spdlog::info("[SnapshotSyncer] Cycle done: synced={} failed={} skipped={}",
                     stats.synced, stats.failed, stats.skipped);
    }
    return stats;
}

SnapshotSyncer::KeyOutcome SnapshotSyncer::syncKey(const CacheClient::DirtyEntry& entry) {
    std::string learnerId;
    std::string subjectId;
    bool malformed = false;
    try {
        std::tie(learnerId, subjectId) = Keys::parseBitmapKey(entry.member);
    } catch (const ProgressError& e) {
        spdlog::error("[SnapshotSyncer] Dropping malformed dirty member: {}", e.what());
        malformed = true;
    }

    try {
        if (malformed) {
            // Nothing can ever sync this member
            cache_.clearDirty(entry.member, entry.generation);
            return KeyOutcome::SKIPPED;
        }
        auto bitmap = cache_.get(entry.member);
        if (!bitmap) {
            // Evicted before sync; writing an empty record would erase the snapshot
            spdlog::warn("[SnapshotSyncer] {} no longer cached, skipping", entry.member);
            cache_.clearDirty(entry.member, entry.generation);
            return KeyOutcome::SKIPPED;
        }
        auto scores = cache_.hashGetAll(Keys::scoresKey(learnerId, subjectId));

        store_.upsert(SnapshotCodec::encode(learnerId, subjectId, *bitmap, scores));

        if (!cache_.clearDirty(entry.member, entry.generation)) {
            spdlog::debug("[SnapshotSyncer] {} changed during sync, stays dirty", entry.member);
            return KeyOutcome::SKIPPED;
        }
        return KeyOutcome::SYNCED;
    } catch (const ProgressError& e) {
        spdlog::warn("[SnapshotSyncer] {} for {} ({}), retrying next cycle",
                     ProgressError::codeString(ErrorCode::SYNC_FAILURE), entry.member, e.what());
        return KeyOutcome::FAILED;
    }
}

void SnapshotSyncer::reportHealth(const SyncStats& stats) {
    auto& registry = MetricRegistry::getInstance();
    auto read = registry.getSnapshot(MetricNames::READ_PATH).value_or(MetricSnapshot{});
    auto write = registry.getSnapshot(MetricNames::WRITE_PATH).value_or(MetricSnapshot{});

    size_t backlog = 0;
    try {
        backlog = cache_.dirtyCount();
    } catch (const ProgressError& e) {
        spdlog::warn("[SnapshotSyncer] Cannot read dirty backlog: {}", e.what());
    }

    if (stats.failed > 0) {
        consecutive_failed_cycles_++;
        if (consecutive_failed_cycles_ >= 3) {
            spdlog::error("[SnapshotSyncer] Sync failing for {} consecutive cycles!",
                          consecutive_failed_cycles_);
        }
    } else {
        if (consecutive_failed_cycles_ > 0) {
            spdlog::info("[SnapshotSyncer] Sync recovered after {} failing cycles",
                         consecutive_failed_cycles_);
        }
        consecutive_failed_cycles_ = 0;
    }

    auto level = stats.failed > 0 ? spdlog::level::warn : spdlog::level::info;
    spdlog::log(level,
                "[SnapshotSyncer] Health | reads={} (avg {}us, max {}us, fallbacks {}) | "
                "writes={} (avg {}us, max {}us) | backlog={} | lease={}",
                read.total_operations, read.get_avg_latency_ns() / 1000,
                read.max_latency_ns / 1000, read.total_fallbacks,
                write.total_operations, write.get_avg_latency_ns() / 1000,
                write.max_latency_ns / 1000, backlog, stats.leaseHeld ? "held" : "busy");
}

} // namespace ProgressEngine
