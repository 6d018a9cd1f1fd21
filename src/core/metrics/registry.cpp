#include <progressengine/core/metrics/registry.hpp>
#include <chrono>

MetricRegistry& MetricRegistry::getInstance() {
    static MetricRegistry instance;
    return instance;
}

Metrics& MetricRegistry::getMetrics(std::string_view name) {
    std::lock_guard<std::mutex> lock(mtx_);
    // try_emplace: Metrics holds atomics and cannot be copied
    auto [it, inserted] = metrics_map_.try_emplace(std::string(name));
    return it->second;
}

std::unordered_map<std::string, MetricSnapshot> MetricRegistry::getSnapshots() {
    std::lock_guard<std::mutex> lock(mtx_);
    std::unordered_map<std::string, MetricSnapshot> snaps;
    snaps.reserve(metrics_map_.size());
    for (const auto& [name, m] : metrics_map_) {
        snaps[name] = buildSnapshot(m);
    }
    return snaps;
}

std::optional<MetricSnapshot> MetricRegistry::getSnapshot(std::string_view name) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = metrics_map_.find(std::string(name));
    if (it == metrics_map_.end()) return std::nullopt;
    return buildSnapshot(it->second);
}

void MetricRegistry::touch(Metrics& m) {
    m.last_operation_timestamp_ms.store(now(), std::memory_order_relaxed);
}

uint64_t MetricRegistry::now() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

MetricSnapshot MetricRegistry::buildSnapshot(const Metrics& m) {
    MetricSnapshot snap;
    snap.total_operations = m.total_operations.load(std::memory_order_relaxed);
    snap.total_errors = m.total_errors.load(std::memory_order_relaxed);
    snap.total_fallbacks = m.total_fallbacks.load(std::memory_order_relaxed);
    snap.total_cache_misses = m.total_cache_misses.load(std::memory_order_relaxed);
    snap.total_first_completions = m.total_first_completions.load(std::memory_order_relaxed);
    snap.total_xp_awarded = m.total_xp_awarded.load(std::memory_order_relaxed);
    snap.total_sync_cycles = m.total_sync_cycles.load(std::memory_order_relaxed);
    snap.total_sync_failures = m.total_sync_failures.load(std::memory_order_relaxed);
    snap.total_latency_ns = m.total_latency_ns.load(std::memory_order_relaxed);
    snap.max_latency_ns = m.max_latency_ns.load(std::memory_order_relaxed);
    snap.latency_samples = m.latency_samples.load(std::memory_order_relaxed);
    snap.last_operation_timestamp_ms = m.last_operation_timestamp_ms.load(std::memory_order_relaxed);
    return snap;
}
