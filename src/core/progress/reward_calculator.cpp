#include <progressengine/core/progress/reward_calculator.hpp>
#include <algorithm>

namespace ProgressEngine {

RewardDecision RewardCalculator::compute(std::optional<int32_t> previousBest,
                                         int32_t score) const {
    score = std::clamp(score, policy_.minScore, policy_.maxScore);

    RewardDecision d;
    if (!previousBest) {
        d.xp = policy_.baseXp + static_cast<int64_t>(score) * policy_.perPointBonus;
        d.isNewRecord = true;
        d.baseGranted = true;
        d.newBestScore = score;
        return d;
    }

    // Replay, or re-completion after an administrative reset
    if (score > *previousBest) {
        d.xp = static_cast<int64_t>(score - *previousBest) * policy_.perPointBonus;
        d.isNewRecord = true;
        d.newBestScore = score;
    }
    return d;
}

} // namespace ProgressEngine
