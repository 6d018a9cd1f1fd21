#pragma once
#include <progressengine/core/metrics/metrics.hpp>
#include <unordered_map>
#include <string>
#include <string_view>
#include <mutex>
#include <optional>

namespace MetricNames {
    constexpr std::string_view READ_PATH = "ReadPath";
    constexpr std::string_view WRITE_PATH = "WritePath";
    constexpr std::string_view CACHE_WARMER = "CacheWarmer";
    constexpr std::string_view SNAPSHOT_SYNCER = "SnapshotSyncer";
}

class MetricRegistry {
public:
    static MetricRegistry& getInstance();

    Metrics& getMetrics(std::string_view name);
    std::unordered_map<std::string, MetricSnapshot> getSnapshots();
    std::optional<MetricSnapshot> getSnapshot(std::string_view name);

    /// Marks the component as active now (stale detection in reports)
    void touch(Metrics& m);

private:
    // Metrics are never erased, so references handed out stay valid
    std::unordered_map<std::string, Metrics> metrics_map_;

    static uint64_t now();
    static MetricSnapshot buildSnapshot(const Metrics& m);

    mutable std::mutex mtx_;

    MetricRegistry() = default;
    ~MetricRegistry() = default;
    MetricRegistry(const MetricRegistry&) = delete;
    MetricRegistry& operator=(const MetricRegistry&) = delete;
};
