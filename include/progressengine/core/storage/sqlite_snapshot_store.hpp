#pragma once

#include <progressengine/core/storage/snapshot_store.hpp>
#include <mutex>
#include <string>
#include <sqlite3.h>

namespace ProgressEngine {

/**
 * @class SqliteSnapshotStore
 * @brief SnapshotStore backed by a single SQLite table.
 *
 * Schema: progress_snapshot(learner_id, subject_id, completion_bitmap,
 * best_scores, last_synced_at) keyed on (learner_id, subject_id).
 * One connection, serialized by a mutex. The syncer is the only writer and
 * reads happen on cache misses only.
 */
class SqliteSnapshotStore : public SnapshotStore {
public:
    explicit SqliteSnapshotStore(const std::string& dbPath);
    ~SqliteSnapshotStore() override;

    SqliteSnapshotStore(const SqliteSnapshotStore&) = delete;
    SqliteSnapshotStore& operator=(const SqliteSnapshotStore&) = delete;

    std::optional<ProgressSnapshot> load(const std::string& learnerId,
                                         const std::string& subjectId) override;
    void upsert(const ProgressSnapshot& snapshot) override;

    size_t count();

private:
    void ensureSchema();
    void exec(const char* sql);
    [[noreturn]] void fail(const std::string& what);

    sqlite3* db_ = nullptr;
    std::string path_;
    std::mutex mutex_;
};

} // namespace ProgressEngine
