#include <gtest/gtest.h>

#include "core/RangePlanner.h"

namespace {
void expectPartition(const std::vector<RangeSpec>& ranges, std::int64_t totalSize) {
    if (totalSize == 0) {
        EXPECT_TRUE(ranges.empty());
        return;
    }

    ASSERT_FALSE(ranges.empty());
    EXPECT_EQ(ranges.front().start, 0);
    EXPECT_EQ(ranges.back().end, totalSize - 1);

    std::int64_t covered = 0;
    for (std::size_t i = 0; i < ranges.size(); ++i) {
        EXPECT_EQ(ranges[i].index, static_cast<int>(i));
        EXPECT_LE(ranges[i].start, ranges[i].end);
        if (i > 0)
            EXPECT_EQ(ranges[i].start, ranges[i - 1].end + 1);
        covered += ranges[i].length();
    }
    EXPECT_EQ(covered, totalSize);
}
}

TEST(RangePlannerTest, RemainderGoesToLastRange) {
    auto ranges = RangePlanner::plan(17, 4);
    ASSERT_TRUE(ranges.has_value());
    ASSERT_EQ(ranges->size(), 4u);

    const std::int64_t expected[4][2] = { { 0, 3 }, { 4, 7 }, { 8, 11 }, { 12, 16 } };
    for (int i = 0; i < 4; ++i) {
        EXPECT_EQ((*ranges)[i].index, i);
        EXPECT_EQ((*ranges)[i].start, expected[i][0]);
        EXPECT_EQ((*ranges)[i].end, expected[i][1]);
    }
    EXPECT_EQ((*ranges)[3].length(), 5);
}

TEST(RangePlannerTest, PartitionsEverySizeWithoutGapsOrOverlap) {
    for (std::int64_t size = 0; size <= 130; ++size) {
        for (int workers = 1; workers <= 12; ++workers) {
            SCOPED_TRACE("size " + std::to_string(size) + " workers " + std::to_string(workers));
            auto ranges = RangePlanner::plan(size, workers);
            ASSERT_TRUE(ranges.has_value());
            expectPartition(*ranges, size);
        }
    }
}

TEST(RangePlannerTest, LargeSizes) {
    const std::int64_t size = 10'000'000'007LL;
    auto ranges = RangePlanner::plan(size, 3);
    ASSERT_TRUE(ranges.has_value());
    ASSERT_EQ(ranges->size(), 3u);
    EXPECT_EQ((*ranges)[0].length(), 3'333'333'335LL);
    EXPECT_EQ((*ranges)[2].length(), 3'333'333'337LL);
    expectPartition(*ranges, size);
}

TEST(RangePlannerTest, RejectsInvalidInput) {
    EXPECT_FALSE(RangePlanner::plan(100, 0).has_value());
    EXPECT_FALSE(RangePlanner::plan(100, -3).has_value());
    EXPECT_FALSE(RangePlanner::plan(-1, 4).has_value());
}

TEST(RangePlannerTest, ZeroSizeProducesNoRanges) {
    auto ranges = RangePlanner::plan(0, 4);
    ASSERT_TRUE(ranges.has_value());
    EXPECT_TRUE(ranges->empty());
}

TEST(RangePlannerTest, FewerBytesThanWorkers) {
    auto ranges = RangePlanner::plan(3, 5);
    ASSERT_TRUE(ranges.has_value());
    ASSERT_EQ(ranges->size(), 3u);
    for (int i = 0; i < 3; ++i) {
        EXPECT_EQ((*ranges)[i].start, i);
        EXPECT_EQ((*ranges)[i].end, i);
    }
}

TEST(RangePlannerTest, SameInputSameOutput) {
    auto first = RangePlanner::plan(1'000'003, 7);
    auto second = RangePlanner::plan(1'000'003, 7);
    ASSERT_TRUE(first && second);
    ASSERT_EQ(first->size(), second->size());
    for (std::size_t i = 0; i < first->size(); ++i) {
        EXPECT_EQ((*first)[i].index, (*second)[i].index);
        EXPECT_EQ((*first)[i].start, (*second)[i].start);
        EXPECT_EQ((*first)[i].end, (*second)[i].end);
    }
}
