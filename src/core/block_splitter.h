#pragma once

#include <vector>
#include <cstdint>
#include "resource_plan.h"  // for BlockInfo

/// Largest parallelism accepted by splitBlocks().
constexpr int kMaxParallelism = 255;

/// Split a resource into download blocks.
///
/// @param total_length  Total resource size in bytes (must be > 0).
/// @param parallelism   Desired number of blocks (1–255).
/// @param scheme        Partitioning rule, see below.
/// @return A vector of BlockInfo with block_id, range_start, range_end set
///         and completed = false.
///
/// Behaviour common to both schemes:
///  - parallelism is clamped to total_length (each block >= 1 byte).
///  - Blocks are contiguous: block[i].range_end + 1 == block[i+1].range_start,
///    block[0] starts at 0 and the last block ends at total_length - 1.
///
/// Balanced: n blocks of total_length / n bytes, the last block absorbs the
/// remainder.
///
/// Legacy: base = total_length / n, block 0 covers [0, total_length % base],
/// then blocks of base bytes follow, total_length / base + 1 blocks in all.
/// The final block is clamped to the end of the resource and dropped if the
/// clamp leaves it empty, which happens exactly when base == 1. The result
/// therefore has total_length / base + 1 blocks when base > 1 and
/// total_length blocks when base == 1.
///
/// @throws DownloadError(EmptyResource) if total_length <= 0.
/// @throws DownloadError(InvalidParallelism) if parallelism is out of range.
std::vector<BlockInfo> splitBlocks(int64_t total_length,
                                   int parallelism,
                                   PartitionScheme scheme = PartitionScheme::Balanced);

/// A single block covering [0, total_length - 1].
std::vector<BlockInfo> wholeResourceBlock(int64_t total_length);
