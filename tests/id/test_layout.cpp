#include <gtest/gtest.h>

#include <bitset>

#include "flake/id/layout.hpp"

using namespace flake::id;

TEST(LayoutTest, FieldWidthsAndMasks) {
    EXPECT_EQ(Layout::MAX_CENTER_ID, 31u);
    EXPECT_EQ(Layout::MAX_WORKER_ID, 31u);
    EXPECT_EQ(Layout::SEQUENCE_MASK, 4095u);

    EXPECT_EQ(Layout::WORKER_ID_SHIFT, 12u);
    EXPECT_EQ(Layout::CENTER_ID_SHIFT, 17u);
    EXPECT_EQ(Layout::TIMESTAMP_SHIFT, 22u);
    EXPECT_EQ(Layout::EPOCH, 1680646028000ULL);
}

TEST(LayoutTest, FieldsDoNotOverlap) {
    const u64 sequence = Layout::SEQUENCE_MASK;
    const u64 worker = Layout::MAX_WORKER_ID << Layout::WORKER_ID_SHIFT;
    const u64 center = Layout::MAX_CENTER_ID << Layout::CENTER_ID_SHIFT;
    const u64 timestamp = Layout::TIMESTAMP_MASK << Layout::TIMESTAMP_SHIFT;

    EXPECT_EQ(sequence & worker, 0u);
    EXPECT_EQ(worker & center, 0u);
    EXPECT_EQ(center & timestamp, 0u);

    std::bitset<64> all(sequence | worker | center | timestamp);
    EXPECT_EQ(all.count(), 63u);
    EXPECT_FALSE(all.test(63));
}

TEST(LayoutTest, ComposeOneMillisecondAfterEpoch) {
    const u64 id = Layout::compose(Layout::EPOCH + 1, 1, 1, 0);
    EXPECT_EQ(id, (1ULL << 22) | (1ULL << 17) | (1ULL << 12));
    EXPECT_EQ(id, 4329472u);
}

TEST(LayoutTest, ComposeAtEpochWithZeroIdsIsSequence) {
    EXPECT_EQ(Layout::compose(Layout::EPOCH, 0, 0, 0), 0u);
    EXPECT_EQ(Layout::compose(Layout::EPOCH, 0, 0, 4095), 4095u);
}

TEST(LayoutTest, DecomposeRecoversFields) {
    const u64 timestamp = Layout::EPOCH + 123456789;
    for (u64 center : {0ULL, 1ULL, 16ULL, 31ULL}) {
        for (u64 worker : {0ULL, 7ULL, 31ULL}) {
            const u64 id = Layout::compose(timestamp, center, worker, 42);
            const auto parts = Layout::decompose(id);
            EXPECT_EQ(parts.timestamp, timestamp);
            EXPECT_EQ(parts.center_id, center);
            EXPECT_EQ(parts.worker_id, worker);
            EXPECT_EQ(parts.sequence, 42u);
        }
    }
}

TEST(LayoutTest, ExtractorsAgreeWithDecompose) {
    const u64 id = Layout::compose(Layout::EPOCH + 99, 20, 10, 7);
    EXPECT_EQ(Layout::extractTimestamp(id), Layout::EPOCH + 99);
    EXPECT_EQ(Layout::extractCenterId(id), 20u);
    EXPECT_EQ(Layout::extractWorkerId(id), 10u);
    EXPECT_EQ(Layout::extractSequence(id), 7u);
    EXPECT_EQ(Layout::decompose(id), (IdParts{Layout::EPOCH + 99, 20, 10, 7}));
}

TEST(LayoutTest, LaterTimestampAlwaysSortsHigher) {
    const u64 early = Layout::compose(Layout::EPOCH + 10, 31, 31, 4095);
    const u64 late = Layout::compose(Layout::EPOCH + 11, 0, 0, 0);
    EXPECT_LT(early, late);
}

static_assert(Layout::compose(Layout::EPOCH + 1, 1, 1, 0) == 4329472ULL);
