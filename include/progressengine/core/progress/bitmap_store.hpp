#pragma once

#include <progressengine/core/cache/cache_client.hpp>
#include <progressengine/core/storage/snapshot_codec.hpp>
#include <progressengine/core/sync/cache_warmer.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace ProgressEngine {

/**
 * @brief Per (learner, subject) completion bitmap and best-score record in the cache.
 *
 * Every mutation marks the pair dirty for the SnapshotSyncer. Reads and writes
 * on a cold key warm it from durable storage first so a setBit can never hide
 * bits that only exist in the snapshot.
 *
 * Cache failures surface as ProgressError(CACHE_UNAVAILABLE); an absent key is
 * an empty bitmap, never an error.
 */
class BitmapStore {
public:
    BitmapStore(CacheClient& cache, CacheWarmer& warmer);

    bool checkBit(const std::string& learnerId, const std::string& subjectId, uint32_t position);

    /// Atomically sets the bit and marks dirty. Returns true if it was already set.
    bool setBit(const std::string& learnerId, const std::string& subjectId, uint32_t position);

    Bytes getBitmap(const std::string& learnerId, const std::string& subjectId);

    void markDirty(const std::string& learnerId, const std::string& subjectId);

    std::optional<int64_t> bestScore(const std::string& learnerId, const std::string& subjectId,
                                     const std::string& lessonId);
    BestScores bestScores(const std::string& learnerId, const std::string& subjectId);
    void setBestScore(const std::string& learnerId, const std::string& subjectId,
                      const std::string& lessonId, int64_t score);

    /**
     * @brief Raises the stored best score to `score` if it is higher.
     *
     * With createIfAbsent == false an absent record stays absent. Marks dirty
     * when the value changed. result.previous == nullopt with result.raised
     * means this call created the record.
     */
    CacheClient::RaiseResult raiseBestScore(const std::string& learnerId,
                                            const std::string& subjectId,
                                            const std::string& lessonId,
                                            int64_t score, bool createIfAbsent);

    /// Rolls back a raise that could not be paid out. Marks dirty when it did.
    bool revertBestScore(const std::string& learnerId, const std::string& subjectId,
                         const std::string& lessonId, int64_t raisedTo,
                         std::optional<int64_t> previous);

    /// Administrative: replaces the bitmap with an empty one. Best scores stay.
    void resetBitmap(const std::string& learnerId, const std::string& subjectId);

private:
    void ensureWarm(const std::string& learnerId, const std::string& subjectId,
                    const std::string& bitmapKey);

    CacheClient& cache_;
    CacheWarmer& warmer_;
};

} // namespace ProgressEngine
