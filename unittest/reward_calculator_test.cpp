// ============================================================================
// REWARD CALCULATOR UNIT TESTS
// ============================================================================
// One-shot base reward and bounded replay bonus
// ============================================================================

#include <gtest/gtest.h>
#include <progressengine/core/progress/reward_calculator.hpp>

using namespace ProgressEngine;

class RewardCalculatorTest : public ::testing::Test {
protected:
    RewardCalculator calc{RewardPolicy{10, 10, 0, 5}};
};

TEST_F(RewardCalculatorTest, FirstCompletionGrantsBasePlusScoreBonus) {
    auto d = calc.compute(std::nullopt, 4);
    EXPECT_EQ(d.xp, 10 + 4 * 10);
    EXPECT_TRUE(d.baseGranted);
    EXPECT_TRUE(d.isNewRecord);
    EXPECT_EQ(d.newBestScore, 4);
}

TEST_F(RewardCalculatorTest, ReplayWithLowerOrEqualScoreAwardsNothing) {
    for (int32_t score : {0, 2, 4}) {
        auto d = calc.compute(4, score);
        EXPECT_EQ(d.xp, 0) << score;
        EXPECT_FALSE(d.isNewRecord);
        EXPECT_FALSE(d.newBestScore.has_value());
    }
}

TEST_F(RewardCalculatorTest, ReplayWithHigherScoreAwardsOnlyTheDifference) {
    auto d = calc.compute(2, 5);
    EXPECT_EQ(d.xp, (5 - 2) * 10);
    EXPECT_TRUE(d.isNewRecord);
    EXPECT_FALSE(d.baseGranted);
    EXPECT_EQ(d.newBestScore, 5);
}

TEST_F(RewardCalculatorTest, MissingRecordGrantsBaseEvenWhenBitWasSet) {
    // An earlier attempt set the bit but never stored its score
    auto d = calc.compute(std::nullopt, 1);
    EXPECT_TRUE(d.baseGranted);
    EXPECT_EQ(d.xp, 10 + 1 * 10);
    EXPECT_EQ(d.newBestScore, 1);
}

TEST_F(RewardCalculatorTest, RecompletionAfterResetNeverRegrantsBase) {
    // Bit cleared by an administrator, best score still on record
    auto d = calc.compute(3, 5);
    EXPECT_FALSE(d.baseGranted);
    EXPECT_EQ(d.xp, 20);

    d = calc.compute(3, 1);
    EXPECT_EQ(d.xp, 0);
}

TEST_F(RewardCalculatorTest, BaseRewardSumsToOneAcrossManyCalls) {
    std::optional<int32_t> best;
    int64_t baseTotal = 0;
    int64_t xpTotal = 0;

    for (int32_t score : {1, 3, 2, 5, 5, 0, 4}) {
        auto d = calc.compute(best, score);
        if (d.baseGranted) baseTotal += calc.policy().baseXp;
        xpTotal += d.xp;
        if (d.newBestScore) best = d.newBestScore;
    }

    EXPECT_EQ(baseTotal, 10);
    // base + 1*10 first time, then climbs to 5 for another 40
    EXPECT_EQ(xpTotal, 10 + 10 + 40);
    EXPECT_EQ(best, 5);
}

TEST_F(RewardCalculatorTest, ScoreIsClampedAndValidated) {
    EXPECT_TRUE(calc.validScore(0));
    EXPECT_TRUE(calc.validScore(5));
    EXPECT_FALSE(calc.validScore(-1));
    EXPECT_FALSE(calc.validScore(6));

    auto d = calc.compute(std::nullopt, 99);
    EXPECT_EQ(d.xp, 10 + 5 * 10);
    EXPECT_EQ(d.newBestScore, 5);
}

TEST(RewardCalculator, DefaultPolicy) {
    RewardCalculator calc;
    EXPECT_EQ(calc.policy().baseXp, 10);
    EXPECT_EQ(calc.policy().perPointBonus, 10);
    EXPECT_EQ(calc.policy().minScore, 0);
    EXPECT_EQ(calc.policy().maxScore, 5);
}
