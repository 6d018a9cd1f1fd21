#include <progressengine/core/cache/in_memory_cache.hpp>
#include <progressengine/core/common/errors.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <functional>
#include <iterator>

namespace ProgressEngine {

InMemoryCache::InMemoryCache(size_t num_shards) {
    if (num_shards == 0) num_shards = 1;
    shards_.reserve(num_shards);
    for (size_t i = 0; i < num_shards; ++i) {
        shards_.push_back(std::make_unique<Shard>());
    }
    spdlog::info("[InMemoryCache] Initialized with {} shards", num_shards);
}

InMemoryCache::Shard& InMemoryCache::shardFor(const std::string& key) {
    return *shards_[std::hash<std::string>{}(key) % shards_.size()];
}

void InMemoryCache::ensureAvailable() const {
    if (!available_.load(std::memory_order_acquire)) {
        throw ProgressError(ErrorCode::CACHE_UNAVAILABLE, "cache unavailable");
    }
}

std::optional<Bytes> InMemoryCache::get(const std::string& key) {
    ensureAvailable();
    Shard& shard = shardFor(key);
    std::lock_guard<std::mutex> lock(shard.mutex);
    auto it = shard.strings.find(key);
    if (it == shard.strings.end()) return std::nullopt;
    return it->second;
}

bool InMemoryCache::exists(const std::string& key) {
    ensureAvailable();
    Shard& shard = shardFor(key);
    std::lock_guard<std::mutex> lock(shard.mutex);
    return shard.strings.count(key) > 0 || shard.hashes.count(key) > 0;
}

void InMemoryCache::set(const std::string& key, const Bytes& value) {
    ensureAvailable();
    Shard& shard = shardFor(key);
    std::lock_guard<std::mutex> lock(shard.mutex);
    shard.strings[key] = value;
}

bool InMemoryCache::setIfAbsent(const std::string& key, const Bytes& value) {
    ensureAvailable();
    Shard& shard = shardFor(key);
    std::lock_guard<std::mutex> lock(shard.mutex);
    auto [it, inserted] = shard.strings.try_emplace(key, value);
    return inserted;
}

void InMemoryCache::remove(const std::string& key) {
    ensureAvailable();
    Shard& shard = shardFor(key);
    std::lock_guard<std::mutex> lock(shard.mutex);
    shard.strings.erase(key);
    shard.hashes.erase(key);
}

bool InMemoryCache::setBit(const std::string& key, uint32_t offset) {
    ensureAvailable();
    Shard& shard = shardFor(key);
    std::lock_guard<std::mutex> lock(shard.mutex);
    return Bitmap::set(shard.strings[key], offset);
}

bool InMemoryCache::getBit(const std::string& key, uint32_t offset) {
    ensureAvailable();
    Shard& shard = shardFor(key);
    std::lock_guard<std::mutex> lock(shard.mutex);
    auto it = shard.strings.find(key);
    if (it == shard.strings.end()) return false;
    return Bitmap::test(it->second, offset);
}

std::optional<int64_t> InMemoryCache::hashGet(const std::string& key, const std::string& field) {
    ensureAvailable();
    Shard& shard = shardFor(key);
    std::lock_guard<std::mutex> lock(shard.mutex);
    auto it = shard.hashes.find(key);
    if (it == shard.hashes.end()) return std::nullopt;
    auto fit = it->second.find(field);
    if (fit == it->second.end()) return std::nullopt;
    return fit->second;
}

std::unordered_map<std::string, int64_t> InMemoryCache::hashGetAll(const std::string& key) {
    ensureAvailable();
    Shard& shard = shardFor(key);
    std::lock_guard<std::mutex> lock(shard.mutex);
    auto it = shard.hashes.find(key);
    if (it == shard.hashes.end()) return {};
    return it->second;
}

void InMemoryCache::hashSet(const std::string& key, const std::string& field, int64_t value) {
    ensureAvailable();
    Shard& shard = shardFor(key);
    std::lock_guard<std::mutex> lock(shard.mutex);
    shard.hashes[key][field] = value;
}

CacheClient::RaiseResult InMemoryCache::hashRaise(const std::string& key,
                                                  const std::string& field,
                                                  int64_t value,
                                                  bool createIfAbsent) {
    ensureAvailable();
    Shard& shard = shardFor(key);
    std::lock_guard<std::mutex> lock(shard.mutex);
    auto hit = shard.hashes.find(key);
    if (hit == shard.hashes.end()) {
        if (!createIfAbsent) return {std::nullopt, false};
        hit = shard.hashes.emplace(key, std::unordered_map<std::string, int64_t>{}).first;
    }
    auto& fields = hit->second;
    auto it = fields.find(field);
    if (it == fields.end()) {
        if (!createIfAbsent) return {std::nullopt, false};
        fields.emplace(field, value);
        return {std::nullopt, true};
    }
    int64_t previous = it->second;
    if (value > previous) {
        it->second = value;
        return {previous, true};
    }
    return {previous, false};
}

bool InMemoryCache::hashRevert(const std::string& key, const std::string& field,
                               int64_t expected, std::optional<int64_t> restore) {
    ensureAvailable();
    Shard& shard = shardFor(key);
    std::lock_guard<std::mutex> lock(shard.mutex);
    auto hit = shard.hashes.find(key);
    if (hit == shard.hashes.end()) return false;
    auto it = hit->second.find(field);
    if (it == hit->second.end() || it->second != expected) return false;
    if (restore) {
        it->second = *restore;
    } else {
        hit->second.erase(it);
    }
    return true;
}

uint64_t InMemoryCache::markDirty(const std::string& member) {
    ensureAvailable();
    std::lock_guard<std::mutex> lock(dirty_mutex_);
    uint64_t generation = next_generation_++;
    dirty_[member] = generation;
    return generation;
}

std::vector<CacheClient::DirtyEntry> InMemoryCache::dirtyBatch(size_t max_count) {
    ensureAvailable();
    std::lock_guard<std::mutex> lock(dirty_mutex_);
    std::vector<DirtyEntry> batch;
    if (dirty_.empty() || max_count == 0) return batch;

    const size_t count = std::min(max_count, dirty_.size());
    batch.reserve(count);
    // Resume where the previous batch stopped so keys that stay dirty cannot
    // starve the rest of the set
    size_t start = dirty_cursor_ % dirty_.size();
    auto it = std::next(dirty_.begin(), static_cast<std::ptrdiff_t>(start));
    while (batch.size() < count) {
        if (it == dirty_.end()) it = dirty_.begin();
        batch.push_back({it->first, it->second});
        ++it;
    }
    dirty_cursor_ = start + count;
    return batch;
}

bool InMemoryCache::clearDirty(const std::string& member, uint64_t generation) {
    ensureAvailable();
    std::lock_guard<std::mutex> lock(dirty_mutex_);
    auto it = dirty_.find(member);
    if (it == dirty_.end() || it->second != generation) {
        return false;
    }
    dirty_.erase(it);
    return true;
}

size_t InMemoryCache::dirtyCount() {
    ensureAvailable();
    std::lock_guard<std::mutex> lock(dirty_mutex_);
    return dirty_.size();
}

bool InMemoryCache::acquireLease(const std::string& name, const std::string& owner,
                                 std::chrono::milliseconds ttl) {
    ensureAvailable();
    auto now = std::chrono::steady_clock::now();
    std::lock_guard<std::mutex> lock(lease_mutex_);
    auto it = leases_.find(name);
    if (it != leases_.end() && it->second.expires_at > now && it->second.owner != owner) {
        return false;
    }
    leases_[name] = Lease{owner, now + ttl};
    return true;
}

void InMemoryCache::releaseLease(const std::string& name, const std::string& owner) {
    ensureAvailable();
    std::lock_guard<std::mutex> lock(lease_mutex_);
    auto it = leases_.find(name);
    if (it != leases_.end() && it->second.owner == owner) {
        leases_.erase(it);
    }
}

void InMemoryCache::evictAll() {
    for (auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard->mutex);
        shard->strings.clear();
        shard->hashes.clear();
    }
    spdlog::warn("[InMemoryCache] All keys evicted");
}

} // namespace ProgressEngine
