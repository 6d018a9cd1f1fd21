#pragma once

#include <progressengine/core/cache/cache_client.hpp>
#include <progressengine/core/storage/snapshot_codec.hpp>
#include <progressengine/core/storage/snapshot_store.hpp>
#include <string>

namespace ProgressEngine {

/**
 * @brief Rebuilds cache state for one (learner, subject) from its durable snapshot.
 */
class CacheWarmer {
public:
    struct DurableState {
        Bytes bitmap;
        BestScores scores;
    };

    CacheWarmer(CacheClient& cache, SnapshotStore& store);

    /**
     * @brief Loads the snapshot and installs it in the cache if the key is still cold.
     *
     * Best scores are max-merged before the bitmap key becomes visible. The
     * bitmap itself goes in with setIfAbsent: a concurrent writer that got
     * there first wins and its bitmap is returned instead. A learner without
     * a snapshot gets an empty bitmap.
     *
     * Throws StoreUnavailable or CorruptSnapshot without touching the cache.
     */
    Bytes warmFromDurable(const std::string& learnerId, const std::string& subjectId);

    /// Reads the durable state without populating the cache (read-path fallback).
    DurableState readThrough(const std::string& learnerId, const std::string& subjectId);

private:
    DurableState loadDurable(const std::string& learnerId, const std::string& subjectId);

    CacheClient& cache_;
    SnapshotStore& store_;
};

} // namespace ProgressEngine
