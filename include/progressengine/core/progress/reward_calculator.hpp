#pragma once

#include <cstdint>
#include <optional>

namespace ProgressEngine {

struct RewardPolicy {
    int64_t baseXp = 10;
    int64_t perPointBonus = 10;
    int32_t minScore = 0;
    int32_t maxScore = 5;
};

struct RewardDecision {
    int64_t xp = 0;
    bool isNewRecord = false;
    bool baseGranted = false;
    std::optional<int32_t> newBestScore;  // set when the stored best must change
};

/**
 * @brief XP policy: full reward once, bounded bonus on a new personal best.
 *
 * The base reward goes to the completion that creates the best-score record
 * (previousBest absent). The record is created atomically, so exactly one
 * caller sees it absent. It survives an administrative bitmap reset, so the
 * base reward is never granted twice for the same lesson.
 */
class RewardCalculator {
public:
    explicit RewardCalculator(RewardPolicy policy = {}) : policy_(policy) {}

    RewardDecision compute(std::optional<int32_t> previousBest, int32_t score) const;

    bool validScore(int32_t score) const {
        return score >= policy_.minScore && score <= policy_.maxScore;
    }

    const RewardPolicy& policy() const { return policy_; }

private:
    RewardPolicy policy_;
};

} // namespace ProgressEngine
