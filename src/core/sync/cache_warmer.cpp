#include <progressengine/core/sync/cache_warmer.hpp>
#include <progressengine/core/cache/keys.hpp>
#include <progressengine/core/common/errors.hpp>
#include <progressengine/core/metrics/registry.hpp>
#include <progressengine/core/utils/clock.hpp>
#include <spdlog/spdlog.h>

namespace ProgressEngine {

CacheWarmer::CacheWarmer(CacheClient& cache, SnapshotStore& store)
    : cache_(cache), store_(store) {}

CacheWarmer::DurableState CacheWarmer::loadDurable(const std::string& learnerId,
                                                   const std::string& subjectId) {
    DurableState state;
    auto snapshot = store_.load(learnerId, subjectId);
    if (snapshot) {
        state.bitmap = SnapshotCodec::decodeBitmap(*snapshot);
        state.scores = SnapshotCodec::decodeScores(snapshot->bestScoresJson);
    }
    return state;
}

Bytes CacheWarmer::warmFromDurable(const std::string& learnerId, const std::string& subjectId) {
    auto& metrics = MetricRegistry::getInstance().getMetrics(MetricNames::CACHE_WARMER);
    ScopedLatency<Metrics> latency(metrics);
    metrics.total_operations.fetch_add(1, std::memory_order_relaxed);
    MetricRegistry::getInstance().touch(metrics);

    DurableState state;
    try {
        state = loadDurable(learnerId, subjectId);
    } catch (const ProgressError& e) {
        metrics.total_errors.fetch_add(1, std::memory_order_relaxed);
        spdlog::error("[CacheWarmer] Cannot warm {}:{} ({}): {}",
                      learnerId, subjectId, ProgressError::codeString(e.code()), e.what());
        throw;
    }

    const auto scoresKey = Keys::scoresKey(learnerId, subjectId);
    for (const auto& [lessonId, score] : state.scores) {
        cache_.hashRaise(scoresKey, lessonId, score, true);
    }

    const auto bitmapKey = Keys::bitmapKey(learnerId, subjectId);
    if (cache_.setIfAbsent(bitmapKey, state.bitmap)) {
        metrics.total_cache_misses.fetch_add(1, std::memory_order_relaxed);
        spdlog::info("[CacheWarmer] Warmed {} ({} bytes, {} scores)",
                     bitmapKey, state.bitmap.size(), state.scores.size());
        return state.bitmap;
    }

    // Lost the race to a writer; its value already contains everything it saw
    spdlog::debug("[CacheWarmer] {} populated concurrently, using cached value", bitmapKey);
    auto current = cache_.get(bitmapKey);
    return current ? *current : state.bitmap;
}

CacheWarmer::DurableState CacheWarmer::readThrough(const std::string& learnerId,
                                                   const std::string& subjectId) {
    return loadDurable(learnerId, subjectId);
}

} // namespace ProgressEngine
