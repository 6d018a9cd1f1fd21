#pragma once

#include <progressengine/core/bitmap/completion_bitmap.hpp>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace ProgressEngine {

/**
 * @brief Fast shared key-value store used by the hot read/write paths.
 *
 * Modelled on the subset of Redis primitives the engine needs. Every
 * operation is atomic for the single key it touches. No multi-key
 * transactions are offered or required.
 *
 * Implementations throw ProgressError(CACHE_UNAVAILABLE) when the backing
 * store cannot be reached. An absent key is never an error.
 */
class CacheClient {
public:
    struct DirtyEntry {
        std::string member;
        uint64_t generation;
    };

    struct RaiseResult {
        std::optional<int64_t> previous;  // nullopt if the field did not exist
        bool raised;                      // true if the new value was stored
    };

    virtual ~CacheClient() = default;

    // --- byte strings ---
    virtual std::optional<Bytes> get(const std::string& key) = 0;
    virtual bool exists(const std::string& key) = 0;
    virtual void set(const std::string& key, const Bytes& value) = 0;
    /// Stores value only if key is absent. Returns true if this call stored it.
    virtual bool setIfAbsent(const std::string& key, const Bytes& value) = 0;
    virtual void remove(const std::string& key) = 0;

    /// SETBIT key offset 1. Creates the key when absent. Returns previous bit.
    virtual bool setBit(const std::string& key, uint32_t offset) = 0;
    /// GETBIT. False when key is absent.
    virtual bool getBit(const std::string& key, uint32_t offset) = 0;

    // --- integer hashes ---
    virtual std::optional<int64_t> hashGet(const std::string& key, const std::string& field) = 0;
    virtual std::unordered_map<std::string, int64_t> hashGetAll(const std::string& key) = 0;
    virtual void hashSet(const std::string& key, const std::string& field, int64_t value) = 0;
    /// Stores value iff the field holds a smaller value, or is absent and
    /// createIfAbsent is set.
    virtual RaiseResult hashRaise(const std::string& key, const std::string& field,
                                  int64_t value, bool createIfAbsent) = 0;
    /// Undoes a raise: if the field still holds `expected`, puts back `restore`
    /// (deleting the field when restore is nullopt). Returns true if it did.
    virtual bool hashRevert(const std::string& key, const std::string& field,
                            int64_t expected, std::optional<int64_t> restore) = 0;

    // --- dirty set ---
    /// Adds member (or bumps its generation). Returns the new generation.
    virtual uint64_t markDirty(const std::string& member) = 0;
    virtual std::vector<DirtyEntry> dirtyBatch(size_t max_count) = 0;
    /// Removes member only if its generation still equals `generation`.
    virtual bool clearDirty(const std::string& member, uint64_t generation) = 0;
    virtual size_t dirtyCount() = 0;

    // --- leases ---
    /// SET name owner NX PX ttl. An expired lease may be taken over.
    virtual bool acquireLease(const std::string& name, const std::string& owner,
                              std::chrono::milliseconds ttl) = 0;
    virtual void releaseLease(const std::string& name, const std::string& owner) = 0;
};

} // namespace ProgressEngine
