#pragma once

#include <progressengine/core/structure/structure_source.hpp>
#include <progressengine/core/structure/structure_tree.hpp>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace ProgressEngine {

/**
 * @class StructureLoader
 * @brief Parses subject hierarchies and keeps the most recent ones in an LRU.
 *
 * A cached tree is served only while the source still reports the same
 * version. The cache is an optimization: a cold load always goes to the source.
 * Trees are shared immutably, so readers keep their snapshot even if the entry
 * is evicted or replaced concurrently.
 */
class StructureLoader {
public:
    static constexpr size_t DEFAULT_CAPACITY = 32;

    explicit StructureLoader(StructureSource& source, size_t capacity = DEFAULT_CAPACITY);

    /// Throws ProgressError SUBJECT_NOT_FOUND or INVALID_STRUCTURE.
    std::shared_ptr<const StructureTree> load(const std::string& subjectId);

    void invalidate(const std::string& subjectId);
    void clear();
    size_t cachedCount() const;

    /// Parses one document. Exposed for tools and tests.
    static std::shared_ptr<const StructureTree> parse(const std::string& subjectId,
                                                      const StructureDocument& doc);

private:
    using LruList = std::list<std::string>;

    struct Entry {
        std::shared_ptr<const StructureTree> tree;
        LruList::iterator lru_pos;
    };

    void insertLocked(const std::string& subjectId, std::shared_ptr<const StructureTree> tree);

    StructureSource& source_;
    size_t capacity_;

    mutable std::mutex mutex_;
    LruList lru_;  // front = most recently used
    std::unordered_map<std::string, Entry> entries_;
};

} // namespace ProgressEngine
