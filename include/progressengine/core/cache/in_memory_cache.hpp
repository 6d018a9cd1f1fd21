#pragma once

#include <progressengine/core/cache/cache_client.hpp>
#include <atomic>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace ProgressEngine {

/**
 * @class InMemoryCache
 * @brief Process-local CacheClient with per-shard locking.
 *
 * Keys hash onto a fixed number of shards, each guarded by its own mutex, so
 * unrelated learners never contend. Dirty markers and leases live in their
 * own small maps since they are touched far less often than bitmaps.
 *
 * setAvailable(false) makes every call throw CACHE_UNAVAILABLE, which lets
 * tests exercise the fallback paths.
 */
class InMemoryCache : public CacheClient {
public:
    static constexpr size_t DEFAULT_SHARDS = 64;

    explicit InMemoryCache(size_t num_shards = DEFAULT_SHARDS);
    ~InMemoryCache() override = default;

    std::optional<Bytes> get(const std::string& key) override;
    bool exists(const std::string& key) override;
    void set(const std::string& key, const Bytes& value) override;
    bool setIfAbsent(const std::string& key, const Bytes& value) override;
    void remove(const std::string& key) override;
    bool setBit(const std::string& key, uint32_t offset) override;
    bool getBit(const std::string& key, uint32_t offset) override;

    std::optional<int64_t> hashGet(const std::string& key, const std::string& field) override;
    std::unordered_map<std::string, int64_t> hashGetAll(const std::string& key) override;
    void hashSet(const std::string& key, const std::string& field, int64_t value) override;
    RaiseResult hashRaise(const std::string& key, const std::string& field,
                          int64_t value, bool createIfAbsent) override;
    bool hashRevert(const std::string& key, const std::string& field,
                    int64_t expected, std::optional<int64_t> restore) override;

    uint64_t markDirty(const std::string& member) override;
    std::vector<DirtyEntry> dirtyBatch(size_t max_count) override;
    bool clearDirty(const std::string& member, uint64_t generation) override;
    size_t dirtyCount() override;

    bool acquireLease(const std::string& name, const std::string& owner,
                      std::chrono::milliseconds ttl) override;
    void releaseLease(const std::string& name, const std::string& owner) override;

    void setAvailable(bool available) {
        available_.store(available, std::memory_order_release);
    }

    /// Drops every key but keeps dirty markers, like a cache eviction storm.
    void evictAll();

private:
    struct Shard {
        std::mutex mutex;
        std::unordered_map<std::string, Bytes> strings;
        std::unordered_map<std::string, std::unordered_map<std::string, int64_t>> hashes;
    };

    struct Lease {
        std::string owner;
        std::chrono::steady_clock::time_point expires_at;
    };

    Shard& shardFor(const std::string& key);
    void ensureAvailable() const;

    std::vector<std::unique_ptr<Shard>> shards_;
    std::atomic<bool> available_{true};

    std::mutex dirty_mutex_;
    std::unordered_map<std::string, uint64_t> dirty_;
    size_t dirty_cursor_ = 0;
    uint64_t next_generation_ = 1;

    std::mutex lease_mutex_;
    std::unordered_map<std::string, Lease> leases_;
};

} // namespace ProgressEngine
