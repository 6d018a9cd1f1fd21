#pragma once

#include <progressengine/core/storage/snapshot_store.hpp>
#include <map>
#include <mutex>
#include <utility>

namespace ProgressEngine {

class InMemorySnapshotStore : public SnapshotStore {
public:
    std::optional<ProgressSnapshot> load(const std::string& learnerId,
                                         const std::string& subjectId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = rows_.find({learnerId, subjectId});
        if (it == rows_.end()) return std::nullopt;
        return it->second;
    }

    void upsert(const ProgressSnapshot& snapshot) override {
        std::lock_guard<std::mutex> lock(mutex_);
        rows_[{snapshot.learnerId, snapshot.subjectId}] = snapshot;
        ++upsert_count_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return rows_.size();
    }

    size_t upsertCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return upsert_count_;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::pair<std::string, std::string>, ProgressSnapshot> rows_;
    size_t upsert_count_ = 0;
};

} // namespace ProgressEngine
