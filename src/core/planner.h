#pragma once

#include <cstdint>
#include <string>

#include "http_engine.h"
#include "resource_plan.h"

struct PlanOptions {
    PartitionScheme scheme = PartitionScheme::Balanced;
    bool legacy_content_mapping = false;  // video/mp4 -> png
    bool honor_range_support = true;      // single unranged block without Accept-Ranges

    /// Options reproducing the legacy plan layout bit for bit
    /// (apart from the one-byte overshoot of its last block).
    static PlanOptions legacy();
};

/// Read Content-Length from the probe.
/// @throws DownloadError(MissingLength) if absent,
///         DownloadError(InvalidLength) if not a non-negative decimal integer.
int64_t parseContentLength(const ResourceMetadata& metadata);

/// Build the download plan for one resource.
///
/// Parallelism is validated first, then the length, so a bad caller argument
/// is reported even for a resource without metadata. Nothing touches the
/// network or the disk.
///
/// @param metadata     Result of the metadata probe.
/// @param url          Requested URL; replaced by metadata.final_url when set.
/// @param save_base    Output path without suffix.
/// @param parallelism  Desired number of blocks.
/// @throws DownloadError (InvalidParallelism, MissingLength, InvalidLength, EmptyResource)
ResourcePlan buildPlan(const ResourceMetadata& metadata,
                       const std::string& url,
                       const std::string& save_base,
                       int parallelism,
                       const PlanOptions& options = PlanOptions());
