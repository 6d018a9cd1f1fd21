#include <progressengine/core/progress/progress_computer.hpp>
#include <progressengine/core/cache/keys.hpp>
#include <progressengine/core/common/errors.hpp>
#include <progressengine/core/metrics/registry.hpp>
#include <progressengine/core/unlock/unlock_calculator.hpp>
#include <progressengine/core/utils/clock.hpp>
#include <spdlog/spdlog.h>
#include <cmath>
#include <exception>

namespace ProgressEngine {

ProgressComputer::ProgressComputer(StructureLoader& structures,
                                   BitmapStore& bitmaps,
                                   CacheWarmer& warmer,
                                   RewardCalculator rewards,
                                   XpWallet& wallet,
                                   AuditSink& audit)
    : structures_(structures),
      bitmaps_(bitmaps),
      warmer_(warmer),
      rewards_(rewards),
      wallet_(wallet),
      audit_(audit) {}

// ============================================================================
// READ PATH
// ============================================================================

ProgressView ProgressComputer::getProgress(const std::string& learnerId,
                                           const std::string& subjectId) {
    auto& metrics = MetricRegistry::getInstance().getMetrics(MetricNames::READ_PATH);
    ScopedLatency<Metrics> latency(metrics);
    metrics.total_operations.fetch_add(1, std::memory_order_relaxed);
    MetricRegistry::getInstance().touch(metrics);

    try {
        Keys::validateId(learnerId, "learner id");
        Keys::validateId(subjectId, "subject id");

        auto tree = structures_.load(subjectId);

        Bytes bitmap;
        BestScores scores;
        bool fromDurable = false;
        try {
            bitmap = bitmaps_.getBitmap(learnerId, subjectId);
            scores = bitmaps_.bestScores(learnerId, subjectId);
        } catch (const ProgressError& e) {
            if (e.code() != ErrorCode::CACHE_UNAVAILABLE) throw;
            spdlog::warn("[ProgressComputer] Cache unavailable for {}:{}, reading durable snapshot",
                         learnerId, subjectId);
            metrics.total_fallbacks.fetch_add(1, std::memory_order_relaxed);
            auto durable = warmer_.readThrough(learnerId, subjectId);
            bitmap = std::move(durable.bitmap);
            scores = std::move(durable.scores);
            fromDurable = true;
        }

        auto states = UnlockCalculator::compute(*tree, bitmap);

        ProgressView view;
        view.subjectId = subjectId;
        view.totalLessons = states.totalLessons;
        view.passedLessons = states.passedLessons;
        view.completionPercentage = completionPercentage(states.passedLessons, states.totalLessons);
        view.servedFromDurable = fromDurable;

        for (uint32_t index : tree->preorder()) {
            if (tree->node(index).isLesson() && states[index] == NodeStatus::UNLOCKED) {
                view.suggestedNextLessonId = tree->node(index).id;
                break;
            }
        }

        view.root = buildNode(*tree, 0, states, scores);

        spdlog::debug("[ProgressComputer] {}:{} passed={}/{} ({}%) next={}",
                      learnerId, subjectId, view.passedLessons, view.totalLessons,
                      view.completionPercentage,
                      view.suggestedNextLessonId.value_or("none"));
        return view;
    } catch (const ProgressError&) {
        metrics.total_errors.fetch_add(1, std::memory_order_relaxed);
        throw;
    }
}

double ProgressComputer::completionPercentage(size_t passed, size_t total) {
    // A subject without lessons has nothing left to do
    if (total == 0) return 100.0;
    double pct = static_cast<double>(passed) * 100.0 / static_cast<double>(total);
    return std::round(pct * 100.0) / 100.0;
}

ProgressNode ProgressComputer::buildNode(const StructureTree& tree, uint32_t index,
                                         const NodeStates& states, const BestScores& scores) {
    const auto& src = tree.node(index);
    ProgressNode out;
    out.id = src.id;
    out.title = src.title;
    out.type = src.type;
    out.status = states[index];
    if (src.isLesson() && out.status == NodeStatus::PASSED) {
        auto it = scores.find(src.id);
        if (it != scores.end()) out.bestScore = it->second;
    }
    out.children.reserve(src.children.size());
    for (uint32_t child : src.children) {
        out.children.push_back(buildNode(tree, child, states, scores));
    }
    return out;
}

// ============================================================================
// WRITE PATH
// ============================================================================

CompletionResult ProgressComputer::completeLesson(const std::string& learnerId,
                                                  const std::string& subjectId,
                                                  const std::string& lessonId,
                                                  int32_t performanceScore) {
    auto& metrics = MetricRegistry::getInstance().getMetrics(MetricNames::WRITE_PATH);
    ScopedLatency<Metrics> latency(metrics);
    metrics.total_operations.fetch_add(1, std::memory_order_relaxed);
    MetricRegistry::getInstance().touch(metrics);

    try {
        Keys::validateId(learnerId, "learner id");
        Keys::validateId(subjectId, "subject id");
        if (!rewards_.validScore(performanceScore)) {
            throw ProgressError(ErrorCode::INVALID_ARGUMENT,
                                "performance score " + std::to_string(performanceScore)
                                + " outside [" + std::to_string(rewards_.policy().minScore) + ", "
                                + std::to_string(rewards_.policy().maxScore) + "]");
        }

        auto tree = structures_.load(subjectId);
        auto lessonIndex = tree->findLesson(lessonId);
        if (!lessonIndex) {
            throw ProgressError(ErrorCode::LESSON_NOT_FOUND,
                                "lesson " + lessonId + " not found in subject " + subjectId);
        }
        const uint32_t position = tree->node(*lessonIndex).bitPosition();

        const bool wasAlreadySet = bitmaps_.setBit(learnerId, subjectId, position);

        // Whoever creates the best-score record earns the base reward. A call
        // that set the bit but failed before this point leaves no record, so
        // the retry still gets it.
        auto raised = bitmaps_.raiseBestScore(learnerId, subjectId, lessonId,
                                              performanceScore, true);
        std::optional<int32_t> previousBest;
        if (raised.previous) previousBest = static_cast<int32_t>(*raised.previous);

        auto decision = rewards_.compute(previousBest, performanceScore);

        CompletionResult result;
        result.success = true;
        result.xpAwarded = decision.xp;
        result.isFirstCompletion = !wasAlreadySet;
        result.isNewRecord = decision.isNewRecord;
        try {
            result.newTotalXp = wallet_.award(learnerId, decision.xp);
        } catch (const std::exception& e) {
            if (raised.raised) {
                undoRaise(learnerId, subjectId, lessonId, performanceScore, raised.previous);
            }
            spdlog::error("[ProgressComputer] XP award for {}:{}:{} failed: {}",
                          learnerId, subjectId, lessonId, e.what());
            throw;
        }

        if (decision.baseGranted) {
            metrics.total_first_completions.fetch_add(1, std::memory_order_relaxed);
        }
        metrics.total_xp_awarded.fetch_add(static_cast<uint64_t>(decision.xp),
                                           std::memory_order_relaxed);

        CompletionEvent event;
        event.learnerId = learnerId;
        event.subjectId = subjectId;
        event.lessonId = lessonId;
        event.score = performanceScore;
        event.xpAwarded = decision.xp;
        event.isFirstCompletion = result.isFirstCompletion;
        event.isNewRecord = result.isNewRecord;
        event.timestampMs = Clock::wall_ms();
        audit_.record(event);

        spdlog::debug("[ProgressComputer] {} completed {} (bit {}) score={} xp={} first={} record={}",
                      learnerId, lessonId, position, performanceScore, decision.xp,
                      result.isFirstCompletion, result.isNewRecord);
        return result;
    } catch (const ProgressError& e) {
        metrics.total_errors.fetch_add(1, std::memory_order_relaxed);
        spdlog::warn("[ProgressComputer] completeLesson {}:{}:{} failed ({}): {}",
                     learnerId, subjectId, lessonId, ProgressError::codeString(e.code()), e.what());
        throw;
    }
}

void ProgressComputer::undoRaise(const std::string& learnerId, const std::string& subjectId,
                                 const std::string& lessonId, int64_t raisedTo,
                                 std::optional<int64_t> previous) {
    try {
        if (!bitmaps_.revertBestScore(learnerId, subjectId, lessonId, raisedTo, previous)) {
            spdlog::warn("[ProgressComputer] Best score for {}:{}:{} moved on, not reverted",
                         learnerId, subjectId, lessonId);
        }
    } catch (const ProgressError& e) {
        // The unpaid raise stays; its reward cannot be claimed again
        spdlog::error("[ProgressComputer] Cannot revert best score for {}:{}:{}: {}",
                      learnerId, subjectId, lessonId, e.what());
    }
}

void ProgressComputer::adminResetProgress(const std::string& learnerId,
                                          const std::string& subjectId) {
    Keys::validateId(learnerId, "learner id");
    Keys::validateId(subjectId, "subject id");
    bitmaps_.resetBitmap(learnerId, subjectId);
    spdlog::info("[ProgressComputer] Progress reset for {}:{}", learnerId, subjectId);
}

} // namespace ProgressEngine
