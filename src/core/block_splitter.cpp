#include "block_splitter.h"
#include "errors.h"

#include <algorithm>
#include <string>

namespace {

BlockInfo makeBlock(int id, int64_t start, int64_t end) {
    BlockInfo b;
    b.block_id    = id;
    b.range_start = start;
    b.range_end   = end;
    b.completed   = false;
    return b;
}

std::vector<BlockInfo> splitBalanced(int64_t total_length, int count) {
    int64_t block_size = total_length / count;

    std::vector<BlockInfo> blocks;
    blocks.reserve(static_cast<size_t>(count));

    int64_t offset = 0;
    for (int i = 0; i < count; ++i) {
        // Last block absorbs the remainder.
        int64_t this_size = block_size;
        if (i == count - 1) {
            this_size = total_length - offset;
        }

        blocks.push_back(makeBlock(i, offset, offset + this_size - 1));
        offset += this_size;
    }

    return blocks;
}

std::vector<BlockInfo> splitLegacy(int64_t total_length, int count) {
    int64_t base_size   = total_length / count;          // >= 1 after clamping
    int64_t head_end    = total_length % base_size;      // block 0 is [0, head_end]
    int64_t block_count = total_length / base_size + 1;
    int64_t last_byte   = total_length - 1;

    std::vector<BlockInfo> blocks;
    blocks.reserve(static_cast<size_t>(block_count));
    blocks.push_back(makeBlock(0, 0, head_end));

    int64_t end = head_end;
    for (int64_t i = 1; i < block_count; ++i) {
        int64_t start = end + 1;
        if (start > last_byte) {
            break;  // only happens when base_size == 1
        }
        end = std::min(end + base_size, last_byte);
        blocks.push_back(makeBlock(static_cast<int>(i), start, end));
    }

    return blocks;
}

} // namespace

std::vector<BlockInfo> splitBlocks(int64_t total_length,
                                   int parallelism,
                                   PartitionScheme scheme) {
    if (total_length <= 0) {
        throw DownloadError(ErrorKind::EmptyResource,
                            "resource length must be > 0, got " + std::to_string(total_length));
    }
    if (parallelism < 1 || parallelism > kMaxParallelism) {
        throw DownloadError(ErrorKind::InvalidParallelism,
                            "parallelism must be in [1, " + std::to_string(kMaxParallelism)
                            + "], got " + std::to_string(parallelism));
    }

    // Actual block count: cannot exceed total_length (each block >= 1 byte).
    int count = static_cast<int>(
        std::min(static_cast<int64_t>(parallelism), total_length));

    if (scheme == PartitionScheme::Legacy) {
        return splitLegacy(total_length, count);
    }
    return splitBalanced(total_length, count);
}

std::vector<BlockInfo> wholeResourceBlock(int64_t total_length) {
    if (total_length <= 0) {
        throw DownloadError(ErrorKind::EmptyResource,
                            "resource length must be > 0, got " + std::to_string(total_length));
    }
    return {makeBlock(0, 0, total_length - 1)};
}
