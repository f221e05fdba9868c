#include <gtest/gtest.h>
#include "block_splitter.h"
#include "errors.h"

#include <algorithm>
#include <utility>
#include <vector>

namespace {

// ── Helper: verify contiguity, no gaps, no overlaps ────────────

void verifyContiguous(const std::vector<BlockInfo>& blocks, int64_t total_length) {
    ASSERT_FALSE(blocks.empty());
    EXPECT_EQ(blocks.front().range_start, 0);
    EXPECT_EQ(blocks.back().range_end, total_length - 1);

    for (size_t i = 0; i < blocks.size(); ++i) {
        EXPECT_EQ(blocks[i].block_id, static_cast<int>(i));
        EXPECT_LE(blocks[i].range_start, blocks[i].range_end) << "block " << i;
        EXPECT_FALSE(blocks[i].completed);
        if (i > 0) {
            EXPECT_EQ(blocks[i].range_start, blocks[i - 1].range_end + 1)
                << "Gap or overlap between block " << (i - 1) << " and " << i;
        }
    }
}

ErrorKind kindOf(int64_t total_length, int parallelism, PartitionScheme scheme) {
    try {
        splitBlocks(total_length, parallelism, scheme);
    } catch (const DownloadError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "splitBlocks(" << total_length << ", " << parallelism << ") did not throw";
    return ErrorKind::JobFailed;
}

std::vector<std::pair<int64_t, int64_t>> ranges(const std::vector<BlockInfo>& blocks) {
    std::vector<std::pair<int64_t, int64_t>> out;
    for (const auto& b : blocks) {
        out.emplace_back(b.range_start, b.range_end);
    }
    return out;
}

using Ranges = std::vector<std::pair<int64_t, int64_t>>;

// ── Balanced scheme ────────────────────────────────────────────

TEST(BlockSplitterTest, EvenSplit) {
    auto blocks = splitBlocks(100, 4);
    ASSERT_EQ(blocks.size(), 4u);
    verifyContiguous(blocks, 100);

    for (const auto& b : blocks) {
        EXPECT_EQ(b.length(), 25);
    }
}

TEST(BlockSplitterTest, RemainderGoesToLastBlock) {
    auto blocks = splitBlocks(103, 4);
    ASSERT_EQ(blocks.size(), 4u);
    verifyContiguous(blocks, 103);

    // First 3 blocks: 25 bytes each, last block: 28 bytes
    for (int i = 0; i < 3; ++i) {
        EXPECT_EQ(blocks[i].length(), 25);
    }
    EXPECT_EQ(blocks[3].length(), 28);
}

TEST(BlockSplitterTest, BalancedGolden1000By4) {
    auto blocks = splitBlocks(1000, 4, PartitionScheme::Balanced);
    EXPECT_EQ(ranges(blocks),
              (Ranges{{0, 249}, {250, 499}, {500, 749}, {750, 999}}));
}

TEST(BlockSplitterTest, ParallelismLargerThanLengthGivesOneBytePerBlock) {
    auto blocks = splitBlocks(3, 32);
    ASSERT_EQ(blocks.size(), 3u);
    verifyContiguous(blocks, 3);

    for (const auto& b : blocks) {
        EXPECT_EQ(b.length(), 1);
    }
}

TEST(BlockSplitterTest, SingleBlockRequested) {
    for (auto scheme : {PartitionScheme::Balanced, PartitionScheme::Legacy}) {
        auto blocks = splitBlocks(500, 1, scheme);
        ASSERT_EQ(blocks.size(), 1u);
        EXPECT_EQ(blocks[0].range_start, 0);
        EXPECT_EQ(blocks[0].range_end, 499);
    }
}

TEST(BlockSplitterTest, SingleByteResource) {
    for (auto scheme : {PartitionScheme::Balanced, PartitionScheme::Legacy}) {
        auto blocks = splitBlocks(1, 8, scheme);
        ASSERT_EQ(blocks.size(), 1u);
        EXPECT_EQ(blocks[0].range_start, 0);
        EXPECT_EQ(blocks[0].range_end, 0);
    }
}

// ── Legacy scheme: first block absorbs total % base ────────────

TEST(BlockSplitterTest, LegacyGolden1000By4) {
    // base = 250, remainder = 1000 % 250 = 0 -> block 0 is the single byte [0,0].
    // The last block is clamped to the final byte of the resource.
    auto blocks = splitBlocks(1000, 4, PartitionScheme::Legacy);
    EXPECT_EQ(ranges(blocks),
              (Ranges{{0, 0}, {1, 250}, {251, 500}, {501, 750}, {751, 999}}));
    verifyContiguous(blocks, 1000);
}

TEST(BlockSplitterTest, LegacyFirstBlockAbsorbsRemainder) {
    // base = 250, remainder = 1003 % 250 = 3
    auto blocks = splitBlocks(1003, 4, PartitionScheme::Legacy);
    EXPECT_EQ(ranges(blocks),
              (Ranges{{0, 3}, {4, 253}, {254, 503}, {504, 753}, {754, 1002}}));
}

TEST(BlockSplitterTest, LegacyRemainderIsTakenAgainstBlockSize) {
    // base = 10 / 3 = 3, remainder = 10 % 3 = 1 (not 10 % parallelism by accident)
    auto blocks = splitBlocks(10, 3, PartitionScheme::Legacy);
    EXPECT_EQ(ranges(blocks), (Ranges{{0, 1}, {2, 4}, {5, 7}, {8, 9}}));
}

TEST(BlockSplitterTest, LegacyDropsEmptyTailWhenBaseIsOneByte) {
    // base = 1: block 0 is [0,0] and every following byte is its own block.
    auto blocks = splitBlocks(5, 5, PartitionScheme::Legacy);
    EXPECT_EQ(ranges(blocks), (Ranges{{0, 0}, {1, 1}, {2, 2}, {3, 3}, {4, 4}}));
}

TEST(BlockSplitterTest, LegacyClampsParallelismInsteadOfDividingByZero) {
    auto blocks = splitBlocks(3, 8, PartitionScheme::Legacy);
    verifyContiguous(blocks, 3);
    EXPECT_EQ(blocks.size(), 3u);
}

TEST(BlockSplitterTest, LegacyHasOneExtraBlockWhenBaseAboveOne) {
    auto blocks = splitBlocks(4096, 8, PartitionScheme::Legacy);
    EXPECT_EQ(blocks.size(), 9u);
    verifyContiguous(blocks, 4096);
}

TEST(BlockSplitterTest, LegacyBlockCountFollowsBaseNotParallelism) {
    // base = 10 / 4 = 2: 10 / 2 + 1 = 6 blocks, not 4 + 1.
    auto blocks = splitBlocks(10, 4, PartitionScheme::Legacy);
    EXPECT_EQ(ranges(blocks),
              (Ranges{{0, 0}, {1, 2}, {3, 4}, {5, 6}, {7, 8}, {9, 9}}));

    // base = 7 / 4 = 1: one block per byte.
    EXPECT_EQ(splitBlocks(7, 4, PartitionScheme::Legacy).size(), 7u);
    EXPECT_EQ(splitBlocks(6, 4, PartitionScheme::Legacy).size(), 6u);
}

TEST(BlockSplitterTest, LegacyBlockCountFormula) {
    for (int64_t len = 1; len <= 300; ++len) {
        for (int p = 1; p <= 16; ++p) {
            int64_t n = std::min<int64_t>(p, len);
            int64_t base = len / n;
            size_t expected = static_cast<size_t>(base == 1 ? len : len / base + 1);
            EXPECT_EQ(splitBlocks(len, p, PartitionScheme::Legacy).size(), expected)
                << "len=" << len << " p=" << p;
        }
    }
}

// ── Coverage property over many (length, parallelism) pairs ───

TEST(BlockSplitterTest, CoversEveryByteExactlyOnce) {
    const std::vector<int64_t> lengths = {1, 2, 3, 7, 10, 99, 100, 101, 255, 256,
                                          1000, 1023, 4097, 65536, 1000003};
    const std::vector<int> parallelisms = {1, 2, 3, 4, 7, 8, 16, 31, 64, 255};

    for (auto scheme : {PartitionScheme::Balanced, PartitionScheme::Legacy}) {
        for (int64_t len : lengths) {
            for (int p : parallelisms) {
                SCOPED_TRACE("len=" + std::to_string(len) + " p=" + std::to_string(p)
                             + (scheme == PartitionScheme::Legacy ? " legacy" : " balanced"));
                auto blocks = splitBlocks(len, p, scheme);
                verifyContiguous(blocks, len);

                int64_t total = 0;
                for (const auto& b : blocks) {
                    total += b.length();
                }
                EXPECT_EQ(total, len);
            }
        }
    }
}

TEST(BlockSplitterTest, BalancedBlockCountIsClampedParallelism) {
    EXPECT_EQ(splitBlocks(1000, 8).size(), 8u);
    EXPECT_EQ(splitBlocks(1000, 7).size(), 7u);
    EXPECT_EQ(splitBlocks(5, 255).size(), 5u);
}

TEST(BlockSplitterTest, WholeResourceBlock) {
    auto blocks = wholeResourceBlock(1234);
    ASSERT_EQ(blocks.size(), 1u);
    EXPECT_EQ(blocks[0].block_id, 0);
    EXPECT_EQ(blocks[0].range_start, 0);
    EXPECT_EQ(blocks[0].range_end, 1233);
}

// ── Invalid arguments ──────────────────────────────────────────

TEST(BlockSplitterTest, RejectsEmptyResource) {
    for (auto scheme : {PartitionScheme::Balanced, PartitionScheme::Legacy}) {
        EXPECT_EQ(kindOf(0, 4, scheme), ErrorKind::EmptyResource);
        EXPECT_EQ(kindOf(-1, 4, scheme), ErrorKind::EmptyResource);
    }
    EXPECT_THROW(wholeResourceBlock(0), DownloadError);
}

TEST(BlockSplitterTest, RejectsInvalidParallelism) {
    for (auto scheme : {PartitionScheme::Balanced, PartitionScheme::Legacy}) {
        EXPECT_EQ(kindOf(100, 0, scheme), ErrorKind::InvalidParallelism);
        EXPECT_EQ(kindOf(100, -3, scheme), ErrorKind::InvalidParallelism);
        EXPECT_EQ(kindOf(100, kMaxParallelism + 1, scheme), ErrorKind::InvalidParallelism);
    }
}

} // namespace
