#include <gtest/gtest.h>

#include "splitpack/chunk_planner.hpp"

#include <cstdint>
#include <vector>

namespace splitpack {

namespace {

// Lengths sum to the total and every range starts where the previous ended.
void ExpectCovers(const std::vector<ChunkRange>& chunks, std::uint64_t total) {
    std::uint64_t off = 0;
    for (const auto& c : chunks) {
        EXPECT_EQ(c.offset, off);
        off += c.length;
    }
    EXPECT_EQ(off, total);
}

} // namespace

TEST(ChunkPlannerTest, BySizeSplitsTenMegabytesIntoThree) {
    constexpr std::uint64_t kMiB = 1024 * 1024;
    std::vector<ChunkRange> chunks;
    auto res = ChunkPlanner::Plan(10 * kMiB, SplitBySize{4 * kMiB}, chunks);
    ASSERT_TRUE(res.is_ok()) << res.msg;

    const std::vector<ChunkRange> expected{{0, 4 * kMiB}, {4 * kMiB, 4 * kMiB}, {8 * kMiB, 2 * kMiB}};
    EXPECT_EQ(chunks, expected);
}

TEST(ChunkPlannerTest, BySizeExactMultipleHasNoEmptyTail) {
    std::vector<ChunkRange> chunks;
    ASSERT_TRUE(ChunkPlanner::Plan(300, SplitBySize{100}, chunks).is_ok());
    ASSERT_EQ(chunks.size(), 3u);
    EXPECT_EQ(chunks.back().length, 100u);
    ExpectCovers(chunks, 300);
}

TEST(ChunkPlannerTest, BySizeLargerThanInputIsOneChunk) {
    std::vector<ChunkRange> chunks;
    ASSERT_TRUE(ChunkPlanner::Plan(10, SplitBySize{4096}, chunks).is_ok());
    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0], (ChunkRange{0, 10}));
}

TEST(ChunkPlannerTest, EmptyInputYieldsOneEmptyChunk) {
    std::vector<ChunkRange> chunks;
    ASSERT_TRUE(ChunkPlanner::Plan(0, SplitBySize{100}, chunks).is_ok());
    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0], (ChunkRange{0, 0}));
}

TEST(ChunkPlannerTest, ByCountSpreadsRemainderOverLeadingChunks) {
    std::vector<ChunkRange> chunks;
    ASSERT_TRUE(ChunkPlanner::Plan(10, SplitByCount{3}, chunks).is_ok());
    const std::vector<ChunkRange> expected{{0, 4}, {4, 3}, {7, 3}};
    EXPECT_EQ(chunks, expected);
}

TEST(ChunkPlannerTest, ByCountOneIsWholeInput) {
    std::vector<ChunkRange> chunks;
    ASSERT_TRUE(ChunkPlanner::Plan(12345, SplitByCount{1}, chunks).is_ok());
    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0], (ChunkRange{0, 12345}));
}

TEST(ChunkPlannerTest, ByCountMoreThanBytesPadsWithEmptyChunks) {
    std::vector<ChunkRange> chunks;
    ASSERT_TRUE(ChunkPlanner::Plan(2, SplitByCount{5}, chunks).is_ok());
    ASSERT_EQ(chunks.size(), 5u);
    EXPECT_EQ(chunks[0].length, 1u);
    EXPECT_EQ(chunks[1].length, 1u);
    EXPECT_EQ(chunks[2].length, 0u);
    EXPECT_EQ(chunks[4].length, 0u);
    ExpectCovers(chunks, 2);
}

TEST(ChunkPlannerTest, ByCountOfEmptyInputStillProducesCount) {
    std::vector<ChunkRange> chunks;
    ASSERT_TRUE(ChunkPlanner::Plan(0, SplitByCount{3}, chunks).is_ok());
    EXPECT_EQ(chunks.size(), 3u);
    ExpectCovers(chunks, 0);
}

TEST(ChunkPlannerTest, CoversInputForManyShapes) {
    const std::uint64_t totals[] = {0, 1, 2, 999, 1000, 1001, 65536, 1000003};
    const std::uint64_t sizes[] = {1, 3, 1000, 4096, 2000000};
    const std::uint64_t counts[] = {1, 2, 7, 1000};
    for (auto total : totals) {
        for (auto size : sizes) {
            std::vector<ChunkRange> chunks;
            ASSERT_TRUE(ChunkPlanner::Plan(total, SplitBySize{size}, chunks).is_ok());
            ExpectCovers(chunks, total);
            for (const auto& c : chunks) EXPECT_LE(c.length, size);
        }
        for (auto count : counts) {
            std::vector<ChunkRange> chunks;
            ASSERT_TRUE(ChunkPlanner::Plan(total, SplitByCount{count}, chunks).is_ok());
            EXPECT_EQ(chunks.size(), count);
            ExpectCovers(chunks, total);
        }
    }
}

TEST(ChunkPlannerTest, RejectsZeroTargets) {
    std::vector<ChunkRange> chunks;
    auto by_size = ChunkPlanner::Plan(100, SplitBySize{0}, chunks);
    EXPECT_FALSE(by_size.is_ok());
    EXPECT_EQ(by_size.kind, ErrorKind::InvalidSpec);

    auto by_count = ChunkPlanner::Plan(100, SplitByCount{0}, chunks);
    EXPECT_FALSE(by_count.is_ok());
    EXPECT_EQ(by_count.kind, ErrorKind::InvalidSpec);
}

TEST(ChunkPlannerTest, RejectsAbsurdCount) {
    std::vector<ChunkRange> chunks;
    auto r = ChunkPlanner::Plan(100, SplitByCount{1ULL << 60}, chunks);
    EXPECT_FALSE(r.is_ok());
    EXPECT_EQ(r.kind, ErrorKind::InvalidSpec);
    EXPECT_TRUE(chunks.empty());

    r = ChunkPlanner::Plan(100, SplitByCount{ChunkPlanner::kMaxParts + 1}, chunks);
    EXPECT_EQ(r.kind, ErrorKind::InvalidSpec);

    ASSERT_TRUE(ChunkPlanner::Plan(3, SplitByCount{ChunkPlanner::kMaxParts}, chunks).is_ok());
    EXPECT_EQ(chunks.size(), ChunkPlanner::kMaxParts);
    ExpectCovers(chunks, 3);
}

TEST(ChunkPlannerTest, RejectsSizeYieldingTooManyParts) {
    std::vector<ChunkRange> chunks;
    auto r = ChunkPlanner::Plan(1ULL << 40, SplitBySize{1}, chunks);
    EXPECT_EQ(r.kind, ErrorKind::InvalidSpec);
    EXPECT_TRUE(chunks.empty());

    ASSERT_TRUE(ChunkPlanner::Plan(ChunkPlanner::kMaxParts, SplitBySize{1}, chunks).is_ok());
    EXPECT_EQ(chunks.size(), ChunkPlanner::kMaxParts);
}

} // namespace splitpack
