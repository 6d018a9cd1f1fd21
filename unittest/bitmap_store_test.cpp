// ============================================================================
// BITMAP STORE UNIT TESTS
// ============================================================================
// Check/set semantics, dirty marking and warming on cold keys
// ============================================================================

#include <gtest/gtest.h>
#include "test_support.hpp"
#include <progressengine/core/cache/keys.hpp>
#include <progressengine/core/storage/snapshot_codec.hpp>

using namespace ProgressEngine;
using namespace ProgressEngine::Testing;

class BitmapStoreTest : public ::testing::Test {
protected:
    InMemoryCache cache{4};
    FlakySnapshotStore store;
    CacheWarmer warmer{cache, store};
    BitmapStore bitmaps{cache, warmer};
};

TEST_F(BitmapStoreTest, AbsentKeyReadsAsZeroProgress) {
    EXPECT_FALSE(bitmaps.checkBit("u1", "math", 0));
    EXPECT_TRUE(bitmaps.getBitmap("u1", "math").empty());
    EXPECT_FALSE(bitmaps.bestScore("u1", "math", "L1").has_value());
}

TEST_F(BitmapStoreTest, SetBitIsIdempotent) {
    EXPECT_FALSE(bitmaps.setBit("u1", "math", 3));
    Bytes once = bitmaps.getBitmap("u1", "math");

    EXPECT_TRUE(bitmaps.setBit("u1", "math", 3));
    EXPECT_EQ(bitmaps.getBitmap("u1", "math"), once);
    EXPECT_TRUE(bitmaps.checkBit("u1", "math", 3));
}

TEST_F(BitmapStoreTest, BitsStaySetAcrossLaterWrites) {
    bitmaps.setBit("u1", "math", 1);
    for (uint32_t p = 2; p < 40; ++p) {
        bitmaps.setBit("u1", "math", p);
        EXPECT_TRUE(bitmaps.checkBit("u1", "math", 1));
    }
}

TEST_F(BitmapStoreTest, FirstSetMarksDirty) {
    bitmaps.setBit("u1", "math", 0);
    EXPECT_EQ(cache.dirtyCount(), 1u);
    auto batch = cache.dirtyBatch(10);
    ASSERT_EQ(batch.size(), 1u);
    EXPECT_EQ(batch[0].member, Keys::bitmapKey("u1", "math"));
}

TEST_F(BitmapStoreTest, LearnersAndSubjectsAreIsolated) {
    bitmaps.setBit("u1", "math", 0);
    EXPECT_FALSE(bitmaps.checkBit("u2", "math", 0));
    EXPECT_FALSE(bitmaps.checkBit("u1", "arabic", 0));
}

TEST_F(BitmapStoreTest, SetBitOnColdKeyKeepsDurableBits) {
    Bytes durable;
    Bitmap::set(durable, 0);
    Bitmap::set(durable, 1);
    store.upsert(SnapshotCodec::encode("u1", "math", durable, {{"L1", 4}}));

    // Cold cache: the write must merge with the snapshot, not replace it
    EXPECT_FALSE(bitmaps.setBit("u1", "math", 2));
    EXPECT_TRUE(bitmaps.checkBit("u1", "math", 0));
    EXPECT_TRUE(bitmaps.checkBit("u1", "math", 1));
    EXPECT_TRUE(bitmaps.setBit("u1", "math", 1));
    EXPECT_EQ(bitmaps.bestScore("u1", "math", "L1"), 4);
}

TEST_F(BitmapStoreTest, SetBestScoreMarksDirty) {
    bitmaps.setBestScore("u1", "math", "L1", 3);
    EXPECT_EQ(bitmaps.bestScore("u1", "math", "L1"), 3);
    EXPECT_EQ(cache.dirtyCount(), 1u);
}

TEST_F(BitmapStoreTest, RaiseBestScoreMarksDirtyOnlyWhenChanged) {
    bitmaps.raiseBestScore("u1", "math", "L1", 3, true);
    auto batch = cache.dirtyBatch(1);
    ASSERT_EQ(batch.size(), 1u);
    ASSERT_TRUE(cache.clearDirty(batch[0].member, batch[0].generation));

    auto r = bitmaps.raiseBestScore("u1", "math", "L1", 2, false);
    EXPECT_FALSE(r.raised);
    EXPECT_EQ(cache.dirtyCount(), 0u);

    r = bitmaps.raiseBestScore("u1", "math", "L1", 5, false);
    EXPECT_TRUE(r.raised);
    EXPECT_EQ(r.previous, 3);
    EXPECT_EQ(cache.dirtyCount(), 1u);
}

TEST_F(BitmapStoreTest, ResetClearsBitsButKeepsScores) {
    bitmaps.setBit("u1", "math", 4);
    bitmaps.raiseBestScore("u1", "math", "L5", 4, true);

    bitmaps.resetBitmap("u1", "math");

    EXPECT_FALSE(bitmaps.checkBit("u1", "math", 4));
    EXPECT_EQ(bitmaps.bestScore("u1", "math", "L5"), 4);
    EXPECT_EQ(cache.dirtyCount(), 1u);
}

TEST_F(BitmapStoreTest, CacheOutageIsDistinctFromAbsentKey) {
    cache.setAvailable(false);
    try {
        bitmaps.checkBit("u1", "math", 0);
        FAIL() << "expected CacheUnavailable";
    } catch (const ProgressError& e) {
        EXPECT_EQ(e.code(), ErrorCode::CACHE_UNAVAILABLE);
    }
    EXPECT_THROW(bitmaps.setBit("u1", "math", 0), ProgressError);
}
