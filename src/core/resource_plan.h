#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "content_kind.h"

/// One contiguous, inclusive byte range of the resource.
struct BlockInfo {
    int block_id = 0;
    int64_t range_start = 0;
    int64_t range_end = 0;
    bool completed = false;

    int64_t length() const { return range_end - range_start + 1; }
};

enum class PartitionScheme {
    Balanced,   // last block absorbs total % n
    Legacy      // first block absorbs total % (total / n)
};

/// Everything the orchestrator needs to run one download job.
/// Built once by buildPlan(); only BlockInfo::completed changes afterwards.
struct ResourcePlan {
    std::string source_url;
    int64_t total_length = 0;
    ContentKind content_kind = ContentKind::Unknown;
    std::string suffix;
    std::string destination_path;
    bool supports_partial_fetch = false;
    bool ranged_fetch = true;
    int requested_parallelism = 1;
    PartitionScheme scheme = PartitionScheme::Balanced;
    std::vector<BlockInfo> blocks;
    int64_t bytes_written = 0;
};
