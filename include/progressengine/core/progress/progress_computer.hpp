#pragma once

#include <progressengine/core/collab/audit_sink.hpp>
#include <progressengine/core/collab/xp_wallet.hpp>
#include <progressengine/core/progress/bitmap_store.hpp>
#include <progressengine/core/progress/progress_view.hpp>
#include <progressengine/core/progress/reward_calculator.hpp>
#include <progressengine/core/structure/structure_loader.hpp>
#include <progressengine/core/sync/cache_warmer.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace ProgressEngine {

/**
 * @class ProgressComputer
 * @brief Read and write paths of the engine.
 *
 * getProgress() combines the structure tree, the completion bitmap and the
 * unlock rules into one view. completeLesson() records a completion, awards
 * XP and reports the event to the audit sink.
 *
 * Errors are ProgressError. The write path never reports success unless the
 * bit set was confirmed by the cache.
 */
class ProgressComputer {
public:
    ProgressComputer(StructureLoader& structures,
                     BitmapStore& bitmaps,
                     CacheWarmer& warmer,
                     RewardCalculator rewards,
                     XpWallet& wallet,
                     AuditSink& audit);

    /**
     * @brief Builds the progress view for a learner.
     *
     * Falls back to a read-through of the durable snapshot when the cache is
     * unavailable.
     */
    ProgressView getProgress(const std::string& learnerId, const std::string& subjectId);

    CompletionResult completeLesson(const std::string& learnerId,
                                    const std::string& subjectId,
                                    const std::string& lessonId,
                                    int32_t performanceScore);

    /// Administrative reset of the completion bitmap. Best scores are kept.
    void adminResetProgress(const std::string& learnerId, const std::string& subjectId);

    static double completionPercentage(size_t passed, size_t total);

private:
    static ProgressNode buildNode(const StructureTree& tree, uint32_t index,
                                  const NodeStates& states, const BestScores& scores);
    void undoRaise(const std::string& learnerId, const std::string& subjectId,
                   const std::string& lessonId, int64_t raisedTo,
                   std::optional<int64_t> previous);

    StructureLoader& structures_;
    BitmapStore& bitmaps_;
    CacheWarmer& warmer_;
    RewardCalculator rewards_;
    XpWallet& wallet_;
    AuditSink& audit_;
};

} // namespace ProgressEngine
