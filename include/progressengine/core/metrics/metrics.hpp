#pragma once
#include <atomic>
#include <cstdint>

/**
 * @brief Counters for one engine component (read path, write path, warmer, syncer)
 *
 * All counters are lock-free atomics updated with relaxed ordering. They are
 * observational only and never gate engine behaviour.
 */
struct Metrics {
    std::atomic<uint64_t> total_operations{0};      // Calls served (reads, completions, warms, keys synced)
    std::atomic<uint64_t> total_errors{0};          // Calls that surfaced an error
    std::atomic<uint64_t> total_fallbacks{0};       // Reads served from the durable store
    std::atomic<uint64_t> total_cache_misses{0};    // Keys warmed from durable storage
    std::atomic<uint64_t> total_first_completions{0};
    std::atomic<uint64_t> total_xp_awarded{0};
    std::atomic<uint64_t> total_sync_cycles{0};
    std::atomic<uint64_t> total_sync_failures{0};   // Keys left dirty after a failed upsert

    // Latency (nanoseconds)
    std::atomic<uint64_t> total_latency_ns{0};
    std::atomic<uint64_t> max_latency_ns{0};
    std::atomic<uint64_t> latency_samples{0};

    std::atomic<uint64_t> last_operation_timestamp_ms{0};

    void recordLatency(uint64_t ns) {
        total_latency_ns.fetch_add(ns, std::memory_order_relaxed);
        latency_samples.fetch_add(1, std::memory_order_relaxed);
        uint64_t prev = max_latency_ns.load(std::memory_order_relaxed);
        while (ns > prev && !max_latency_ns.compare_exchange_weak(prev, ns, std::memory_order_relaxed)) {
        }
    }
};

/**
 * Plain snapshot of Metrics for reporting
 */
struct MetricSnapshot {
    uint64_t total_operations = 0;
    uint64_t total_errors = 0;
    uint64_t total_fallbacks = 0;
    uint64_t total_cache_misses = 0;
    uint64_t total_first_completions = 0;
    uint64_t total_xp_awarded = 0;
    uint64_t total_sync_cycles = 0;
    uint64_t total_sync_failures = 0;
    uint64_t total_latency_ns = 0;
    uint64_t max_latency_ns = 0;
    uint64_t latency_samples = 0;
    uint64_t last_operation_timestamp_ms = 0;

    uint64_t get_avg_latency_ns() const {
        return latency_samples > 0 ? total_latency_ns / latency_samples : 0;
    }

    double get_error_rate_percent() const {
        return total_operations > 0 ? (total_errors * 100.0) / total_operations : 0.0;
    }
};
