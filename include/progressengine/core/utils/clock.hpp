// ============================================================================
// HIGH-PRECISION MONOTONIC CLOCK

#pragma once

#include <chrono>
#include <cstdint>

namespace ProgressEngine {

class Clock {
public:
    // Get current time in nanoseconds (monotonic, steady)
    static inline uint64_t now_ns() {
        auto now = std::chrono::steady_clock::now();
        return std::chrono::duration_cast<std::chrono::nanoseconds>(
            now.time_since_epoch()
        ).count();
    }

    // Wall-clock milliseconds since epoch (event timestamps)
    static inline uint64_t wall_ms() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()
        ).count();
    }
};

/**
 * @brief Records elapsed time into a Metrics slot on scope exit.
 */
template <typename MetricsT>
class ScopedLatency {
public:
    explicit ScopedLatency(MetricsT& m) : metrics_(m), start_ns_(Clock::now_ns()) {}
    ~ScopedLatency() { metrics_.recordLatency(Clock::now_ns() - start_ns_); }

    ScopedLatency(const ScopedLatency&) = delete;
    ScopedLatency& operator=(const ScopedLatency&) = delete;

private:
    MetricsT& metrics_;
    uint64_t start_ns_;
};

} // namespace ProgressEngine
