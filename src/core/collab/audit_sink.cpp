#include <progressengine/core/collab/audit_sink.hpp>
#include <spdlog/spdlog.h>
#include <exception>

namespace ProgressEngine {

void LogAuditSink::record(const CompletionEvent& event) {
    spdlog::info("[Audit] learner={} subject={} lesson={} score={} xp={} first={} record={} ts={}",
                 event.learnerId, event.subjectId, event.lessonId, event.score,
                 event.xpAwarded, event.isFirstCompletion, event.isNewRecord,
                 event.timestampMs);
}

AsyncAuditSink::AsyncAuditSink(std::shared_ptr<AuditSink> delegate, size_t workerThreads)
    : delegate_(std::move(delegate)), pool_(workerThreads) {}

AsyncAuditSink::~AsyncAuditSink() {
    shutdown();
}

void AsyncAuditSink::record(const CompletionEvent& event) {
    auto delegate = delegate_;
    bool queued = pool_.submit([delegate, event]() {
        try {
            delegate->record(event);
        } catch (const std::exception& e) {
            spdlog::warn("[Audit] Dropped event for {}:{} lesson {}: {}",
                         event.learnerId, event.subjectId, event.lessonId, e.what());
        } catch (...) {
            spdlog::warn("[Audit] Dropped event for {}:{} lesson {}: unknown error",
                         event.learnerId, event.subjectId, event.lessonId);
        }
    });
    if (!queued) {
        spdlog::warn("[Audit] Sink stopped, event for lesson {} not recorded", event.lessonId);
    }
}

void AsyncAuditSink::shutdown() {
    pool_.shutdown();
}

} // namespace ProgressEngine
