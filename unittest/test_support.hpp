// ============================================================================
// SHARED TEST DOUBLES
// ============================================================================
// In-process stand-ins for the content source, durable store and audit log
// ============================================================================

#pragma once

#include <progressengine/core/cache/in_memory_cache.hpp>
#include <progressengine/core/collab/audit_sink.hpp>
#include <progressengine/core/collab/xp_wallet.hpp>
#include <progressengine/core/common/errors.hpp>
#include <progressengine/core/progress/bitmap_store.hpp>
#include <progressengine/core/progress/progress_computer.hpp>
#include <progressengine/core/storage/in_memory_snapshot_store.hpp>
#include <progressengine/core/structure/structure_loader.hpp>
#include <progressengine/core/structure/structure_source.hpp>
#include <progressengine/core/sync/cache_warmer.hpp>
#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace ProgressEngine {
namespace Testing {

constexpr const char* FIXTURE_DIR = "unittest/fixtures/subjects";

/// Structure source with documents set from the test body. Each put() bumps the version.
class MapStructureSource : public StructureSource {
public:
    void put(const std::string& subjectId, const std::string& json) {
        std::lock_guard<std::mutex> lock(mutex_);
        docs_[subjectId] = StructureDocument{json, "v" + std::to_string(++revision_)};
    }

    void erase(const std::string& subjectId) {
        std::lock_guard<std::mutex> lock(mutex_);
        docs_.erase(subjectId);
    }

    std::optional<StructureDocument> fetch(const std::string& subjectId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++fetches_;
        auto it = docs_.find(subjectId);
        if (it == docs_.end()) return std::nullopt;
        return it->second;
    }

    std::optional<std::string> version(const std::string& subjectId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = docs_.find(subjectId);
        if (it == docs_.end()) return std::nullopt;
        return it->second.version;
    }

    int fetches() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return fetches_;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, StructureDocument> docs_;
    int revision_ = 0;
    int fetches_ = 0;
};

/// In-memory cache whose next best-score raise can be made to fail.
class FlakyCache : public InMemoryCache {
public:
    explicit FlakyCache(size_t shards) : InMemoryCache(shards) {}

    RaiseResult hashRaise(const std::string& key, const std::string& field,
                          int64_t value, bool createIfAbsent) override {
        if (failNextRaise.exchange(false)) {
            throw ProgressError(ErrorCode::CACHE_UNAVAILABLE, "raise dropped");
        }
        return InMemoryCache::hashRaise(key, field, value, createIfAbsent);
    }

    std::atomic<bool> failNextRaise{false};
};

/// XP wallet whose next award can be made to fail.
class FlakyXpWallet : public InMemoryXpWallet {
public:
    int64_t award(const std::string& learnerId, int64_t xp) override {
        if (failNextAward.exchange(false)) {
            throw std::runtime_error("wallet unreachable");
        }
        return InMemoryXpWallet::award(learnerId, xp);
    }

    std::atomic<bool> failNextAward{false};
};

/// In-memory durable store that can be switched off or made to fail per learner.
class FlakySnapshotStore : public InMemorySnapshotStore {
public:
    std::optional<ProgressSnapshot> load(const std::string& learnerId,
                                         const std::string& subjectId) override {
        if (!available.load()) {
            throw ProgressError(ErrorCode::STORE_UNAVAILABLE, "store down");
        }
        ++loads;
        return InMemorySnapshotStore::load(learnerId, subjectId);
    }

    void upsert(const ProgressSnapshot& snapshot) override {
        if (!available.load() || snapshot.learnerId == failLearner) {
            throw ProgressError(ErrorCode::STORE_UNAVAILABLE, "upsert rejected");
        }
        if (beforeUpsert) beforeUpsert(snapshot);
        InMemorySnapshotStore::upsert(snapshot);
    }

    std::atomic<bool> available{true};
    std::atomic<int> loads{0};
    std::string failLearner;
    std::function<void(const ProgressSnapshot&)> beforeUpsert;
};

class RecordingAuditSink : public AuditSink {
public:
    void record(const CompletionEvent& event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(event);
    }

    std::vector<CompletionEvent> events() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<CompletionEvent> events_;
};

/**
 * @brief Fully wired engine over in-memory collaborators.
 */
struct Engine {
    explicit Engine(StructureSource& source, RewardPolicy policy = {})
        : cache(4),
          structures(source, 8),
          warmer(cache, store),
          bitmaps(cache, warmer),
          computer(structures, bitmaps, warmer, RewardCalculator(policy), wallet, audit) {}

    FlakyCache cache;
    FlakySnapshotStore store;
    StructureLoader structures;
    CacheWarmer warmer;
    BitmapStore bitmaps;
    FlakyXpWallet wallet;
    RecordingAuditSink audit;
    ProgressComputer computer;
};

/// Status of the node with the given id inside a progress view.
inline const ProgressNode* findNode(const ProgressNode& root, const std::string& id) {
    if (root.id == id) return &root;
    for (const auto& child : root.children) {
        if (const ProgressNode* hit = findNode(child, id)) return hit;
    }
    return nullptr;
}

} // namespace Testing
} // namespace ProgressEngine
