#pragma once

#include <progressengine/core/utils/thread_pool.hpp>
#include <cstdint>
#include <memory>
#include <string>

namespace ProgressEngine {

struct CompletionEvent {
    std::string learnerId;
    std::string subjectId;
    std::string lessonId;
    int32_t score = 0;
    int64_t xpAwarded = 0;
    bool isFirstCompletion = false;
    bool isNewRecord = false;
    uint64_t timestampMs = 0;
};

/**
 * @brief Interaction log for completion events.
 */
class AuditSink {
public:
    virtual ~AuditSink() = default;
    virtual void record(const CompletionEvent& event) = 0;
};

/// Writes each event as one info line.
class LogAuditSink : public AuditSink {
public:
    void record(const CompletionEvent& event) override;
};

/**
 * @brief Fire-and-forget wrapper: record() only enqueues onto the pool.
 *
 * Failures of the delegate are logged and never reach the completion path.
 */
class AsyncAuditSink : public AuditSink {
public:
    AsyncAuditSink(std::shared_ptr<AuditSink> delegate, size_t workerThreads);
    ~AsyncAuditSink() override;

    void record(const CompletionEvent& event) override;

    /// Drains queued events and stops the workers.
    void shutdown();
    size_t pending() const { return pool_.getPendingTasks(); }

private:
    std::shared_ptr<AuditSink> delegate_;
    ThreadPool pool_;
};

} // namespace ProgressEngine
