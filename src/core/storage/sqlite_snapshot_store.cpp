#include <progressengine/core/storage/sqlite_snapshot_store.hpp>
#include <progressengine/core/common/errors.hpp>
#include <spdlog/spdlog.h>
#include <chrono>

namespace ProgressEngine {

namespace {

// RAII wrapper so every early return finalizes the statement
class Statement {
public:
    Statement(sqlite3* db, const char* sql) {
        rc_ = sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr);
    }
    ~Statement() {
        if (stmt_) sqlite3_finalize(stmt_);
    }
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    bool ok() const { return rc_ == SQLITE_OK && stmt_ != nullptr; }
    sqlite3_stmt* get() const { return stmt_; }

    bool bindText(int idx, const std::string& value) {
        return sqlite3_bind_text(stmt_, idx, value.c_str(),
                                 static_cast<int>(value.size()), SQLITE_TRANSIENT) == SQLITE_OK;
    }

private:
    sqlite3_stmt* stmt_ = nullptr;
    int rc_ = SQLITE_ERROR;
};

std::string columnText(sqlite3_stmt* stmt, int col) {
    const unsigned char* text = sqlite3_column_text(stmt, col);
    if (!text) return {};
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<size_t>(sqlite3_column_bytes(stmt, col)));
}

int64_t nowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace

SqliteSnapshotStore::SqliteSnapshotStore(const std::string& dbPath) : path_(dbPath) {
    if (sqlite3_open(dbPath.c_str(), &db_) != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        spdlog::error("[SqliteSnapshotStore] Failed to open {}: {}", dbPath, msg);
        throw ProgressError(ErrorCode::STORE_UNAVAILABLE,
                            "failed to open snapshot database " + dbPath + ": " + msg);
    }
    sqlite3_busy_timeout(db_, 1000);
    ensureSchema();
    spdlog::info("[SqliteSnapshotStore] Opened {}", dbPath);
}

SqliteSnapshotStore::~SqliteSnapshotStore() {
    if (db_) {
        sqlite3_close(db_);
    }
}

void SqliteSnapshotStore::ensureSchema() {
    exec("PRAGMA journal_mode=WAL;");
    exec("CREATE TABLE IF NOT EXISTS progress_snapshot ("
         " learner_id TEXT NOT NULL,"
         " subject_id TEXT NOT NULL,"
         " completion_bitmap TEXT NOT NULL DEFAULT '',"
         " best_scores TEXT NOT NULL DEFAULT '{}',"
         " last_synced_at INTEGER NOT NULL,"
         " PRIMARY KEY (learner_id, subject_id));");
}

void SqliteSnapshotStore::exec(const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        fail(msg);
    }
}

void SqliteSnapshotStore::fail(const std::string& what) {
    spdlog::error("[SqliteSnapshotStore] {} ({})", what, path_);
    throw ProgressError(ErrorCode::STORE_UNAVAILABLE, "snapshot store: " + what);
}

std::optional<ProgressSnapshot> SqliteSnapshotStore::load(const std::string& learnerId,
                                                          const std::string& subjectId) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_,
        "SELECT completion_bitmap, best_scores FROM progress_snapshot"
        " WHERE learner_id = ?1 AND subject_id = ?2;");
    if (!stmt.ok() || !stmt.bindText(1, learnerId) || !stmt.bindText(2, subjectId)) {
        fail(sqlite3_errmsg(db_));
    }

    int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_DONE) {
        return std::nullopt;
    }
    if (rc != SQLITE_ROW) {
        fail(sqlite3_errmsg(db_));
    }

    ProgressSnapshot snap;
    snap.learnerId = learnerId;
    snap.subjectId = subjectId;
    snap.completionBitmapBase64 = columnText(stmt.get(), 0);
    snap.bestScoresJson = columnText(stmt.get(), 1);
    return snap;
}

void SqliteSnapshotStore::upsert(const ProgressSnapshot& snapshot) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_,
        "INSERT INTO progress_snapshot"
        " (learner_id, subject_id, completion_bitmap, best_scores, last_synced_at)"
        " VALUES (?1, ?2, ?3, ?4, ?5)"
        " ON CONFLICT(learner_id, subject_id) DO UPDATE SET"
        " completion_bitmap = excluded.completion_bitmap,"
        " best_scores = excluded.best_scores,"
        " last_synced_at = excluded.last_synced_at;");
    if (!stmt.ok()
        || !stmt.bindText(1, snapshot.learnerId)
        || !stmt.bindText(2, snapshot.subjectId)
        || !stmt.bindText(3, snapshot.completionBitmapBase64)
        || !stmt.bindText(4, snapshot.bestScoresJson.empty() ? "{}" : snapshot.bestScoresJson)
        || sqlite3_bind_int64(stmt.get(), 5, nowMs()) != SQLITE_OK) {
        fail(sqlite3_errmsg(db_));
    }

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        spdlog::error("[SqliteSnapshotStore] Failed to upsert {}:{}",
                      snapshot.learnerId, snapshot.subjectId);
        fail(sqlite3_errmsg(db_));
    }
}

size_t SqliteSnapshotStore::count() {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_, "SELECT COUNT(*) FROM progress_snapshot;");
    if (!stmt.ok() || sqlite3_step(stmt.get()) != SQLITE_ROW) {
        fail(sqlite3_errmsg(db_));
    }
    return static_cast<size_t>(sqlite3_column_int64(stmt.get(), 0));
}

} // namespace ProgressEngine
