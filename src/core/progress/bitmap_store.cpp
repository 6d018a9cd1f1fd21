#include <progressengine/core/progress/bitmap_store.hpp>
#include <progressengine/core/cache/keys.hpp>
#include <spdlog/spdlog.h>

namespace ProgressEngine {

BitmapStore::BitmapStore(CacheClient& cache, CacheWarmer& warmer)
    : cache_(cache), warmer_(warmer) {}

void BitmapStore::ensureWarm(const std::string& learnerId, const std::string& subjectId,
                             const std::string& bitmapKey) {
    if (!cache_.exists(bitmapKey)) {
        spdlog::debug("[BitmapStore] Cache miss on {}", bitmapKey);
        warmer_.warmFromDurable(learnerId, subjectId);
    }
}

bool BitmapStore::checkBit(const std::string& learnerId, const std::string& subjectId,
                           uint32_t position) {
    const auto key = Keys::bitmapKey(learnerId, subjectId);
    ensureWarm(learnerId, subjectId, key);
    return cache_.getBit(key, position);
}

bool BitmapStore::setBit(const std::string& learnerId, const std::string& subjectId,
                         uint32_t position) {
    const auto key = Keys::bitmapKey(learnerId, subjectId);
    ensureWarm(learnerId, subjectId, key);
    bool wasSet = cache_.setBit(key, position);
    if (!wasSet) {
        cache_.markDirty(key);
    }
    return wasSet;
}

Bytes BitmapStore::getBitmap(const std::string& learnerId, const std::string& subjectId) {
    const auto key = Keys::bitmapKey(learnerId, subjectId);
    auto bitmap = cache_.get(key);
    if (bitmap) {
        return *bitmap;
    }
    return warmer_.warmFromDurable(learnerId, subjectId);
}

void BitmapStore::markDirty(const std::string& learnerId, const std::string& subjectId) {
    cache_.markDirty(Keys::bitmapKey(learnerId, subjectId));
}

std::optional<int64_t> BitmapStore::bestScore(const std::string& learnerId,
                                              const std::string& subjectId,
                                              const std::string& lessonId) {
    ensureWarm(learnerId, subjectId, Keys::bitmapKey(learnerId, subjectId));
    return cache_.hashGet(Keys::scoresKey(learnerId, subjectId), lessonId);
}

BestScores BitmapStore::bestScores(const std::string& learnerId, const std::string& subjectId) {
    ensureWarm(learnerId, subjectId, Keys::bitmapKey(learnerId, subjectId));
    return cache_.hashGetAll(Keys::scoresKey(learnerId, subjectId));
}

void BitmapStore::setBestScore(const std::string& learnerId, const std::string& subjectId,
                               const std::string& lessonId, int64_t score) {
    const auto key = Keys::bitmapKey(learnerId, subjectId);
    ensureWarm(learnerId, subjectId, key);
    cache_.hashSet(Keys::scoresKey(learnerId, subjectId), lessonId, score);
    cache_.markDirty(key);
}

CacheClient::RaiseResult BitmapStore::raiseBestScore(const std::string& learnerId,
                                                     const std::string& subjectId,
                                                     const std::string& lessonId,
                                                     int64_t score, bool createIfAbsent) {
    const auto key = Keys::bitmapKey(learnerId, subjectId);
    ensureWarm(learnerId, subjectId, key);
    auto result = cache_.hashRaise(Keys::scoresKey(learnerId, subjectId), lessonId,
                                   score, createIfAbsent);
    if (result.raised) {
        cache_.markDirty(key);
    }
    return result;
}

bool BitmapStore::revertBestScore(const std::string& learnerId, const std::string& subjectId,
                                  const std::string& lessonId, int64_t raisedTo,
                                  std::optional<int64_t> previous) {
    bool reverted = cache_.hashRevert(Keys::scoresKey(learnerId, subjectId), lessonId,
                                      raisedTo, previous);
    if (reverted) {
        cache_.markDirty(Keys::bitmapKey(learnerId, subjectId));
    }
    return reverted;
}

void BitmapStore::resetBitmap(const std::string& learnerId, const std::string& subjectId) {
    const auto key = Keys::bitmapKey(learnerId, subjectId);
    // Warm first so best scores from the snapshot survive into the cache
    ensureWarm(learnerId, subjectId, key);
    cache_.set(key, Bytes{});
    cache_.markDirty(key);
    spdlog::warn("[BitmapStore] Bitmap {} reset by administrator", key);
}

} // namespace ProgressEngine
