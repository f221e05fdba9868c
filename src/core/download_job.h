#pragma once

#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

#include "block.h"
#include "resource_plan.h"

class RangeFetcher;

/// Outcome of DownloadJob::run().
struct JobReport {
    std::string destination_path;
    int64_t total_length = 0;
    int64_t bytes_written = 0;
    size_t block_count = 0;
    std::vector<int> completed_blocks;    // ascending block ids
    std::vector<BlockFailure> failures;   // ascending block ids
    double elapsed_seconds = 0.0;

    bool ok() const { return failures.empty(); }

    /// One line for the user: path and byte count, or the failed block ids.
    std::string summary() const;

    /// @throws DownloadError(JobFailed) naming every failed block.
    void throwIfFailed() const;
};

/// Runs a plan: one fetch+write unit per block, all concurrently.
///
/// The output file is opened and sized once before any unit starts and is
/// shared by all of them. Every unit runs to completion even when siblings
/// fail; blocks that completed stay on disk.
class DownloadJob {
public:
    /// fetcher is non-owning and must outlive run().
    DownloadJob(ResourcePlan plan, RangeFetcher* fetcher);

    DownloadJob(const DownloadJob&) = delete;
    DownloadJob& operator=(const DownloadJob&) = delete;

    /// Execute the plan. May be called once.
    /// @throws DownloadError(IOError) if the output file cannot be created,
    ///         sized or flushed.
    JobReport run();

    /// The plan; completed flags and bytes_written are filled in by run().
    const ResourcePlan& plan() const { return plan_; }

    int64_t bytesWritten() const { return bytes_written_.load(); }

private:
    ResourcePlan plan_;
    RangeFetcher* fetcher_;   // non-owning
    std::atomic<int64_t> bytes_written_{0};
    bool started_ = false;
};
