#include "download_job.h"
#include "errors.h"
#include "logger.h"
#include "output_file.h"
#include "range_fetcher.h"
#include "thread_pool.h"

#include <chrono>
#include <functional>
#include <memory>
#include <sstream>
#include <stdexcept>

// ── JobReport ──────────────────────────────────────────────────

std::string JobReport::summary() const
{
    std::ostringstream oss;
    if (ok()) {
        oss << "Saved " << destination_path << " (" << bytes_written << " bytes, "
            << block_count << " block(s))";
        return oss.str();
    }

    oss << failures.size() << " of " << block_count << " block(s) failed for "
        << destination_path << ":";
    for (const auto& f : failures) {
        oss << " #" << f.block_id << " " << errorKindName(f.kind) << " (" << f.message << ");";
    }
    return oss.str();
}

void JobReport::throwIfFailed() const
{
    if (ok()) {
        return;
    }
    throw DownloadError(ErrorKind::JobFailed, summary());
}

// ── DownloadJob ────────────────────────────────────────────────

DownloadJob::DownloadJob(ResourcePlan plan, RangeFetcher* fetcher)
    : plan_(std::move(plan))
    , fetcher_(fetcher)
{
}

JobReport DownloadJob::run()
{
    if (started_) {
        throw std::logic_error("DownloadJob::run() called twice");
    }
    started_ = true;

    auto started_at = std::chrono::steady_clock::now();
    Logger::instance().info("Downloading " + plan_.source_url + " -> " + plan_.destination_path
        + " (" + std::to_string(plan_.total_length) + " bytes, "
        + std::to_string(plan_.blocks.size()) + " block(s), "
        + (plan_.ranged_fetch ? "ranged" : "unranged") + ")");

    // Created and sized once, before any worker runs.
    OutputFile output(plan_.destination_path, plan_.total_length);

    std::vector<std::unique_ptr<Block>> blocks;
    blocks.reserve(plan_.blocks.size());
    for (const auto& info : plan_.blocks) {
        blocks.push_back(std::make_unique<Block>(
            info, plan_, fetcher_, &output,
            [this](int /*block_id*/, int64_t bytes) {
                bytes_written_.fetch_add(bytes);
            }));
    }

    std::vector<std::function<bool()>> units;
    units.reserve(blocks.size());
    for (auto& block : blocks) {
        Block* block_ptr = block.get();
        units.emplace_back([block_ptr]() { return block_ptr->execute(); });
    }

    // One worker per block; runAll returns once every unit has finished.
    std::vector<std::future<bool>> results;
    {
        ThreadPool pool(blocks.size());
        results = pool.runAll(std::move(units));
    }

    JobReport report;
    report.destination_path = plan_.destination_path;
    report.total_length = plan_.total_length;
    report.block_count = blocks.size();

    for (size_t i = 0; i < blocks.size(); ++i) {
        const Block& block = *blocks[i];
        bool succeeded = false;
        try {
            succeeded = results[i].get();
        } catch (const std::exception& e) {
            report.failures.push_back(
                BlockFailure{block.getInfo().block_id, ErrorKind::TransportError, e.what()});
            continue;
        }

        plan_.blocks[i].completed = block.getInfo().completed;
        if (succeeded) {
            report.completed_blocks.push_back(plan_.blocks[i].block_id);
        } else if (block.failure()) {
            report.failures.push_back(*block.failure());
        }
    }

    if (report.ok()) {
        output.sync();
    }

    plan_.bytes_written = bytes_written_.load();
    report.bytes_written = plan_.bytes_written;
    report.elapsed_seconds = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - started_at).count();

    if (report.ok()) {
        Logger::instance().info(report.summary());
    } else {
        Logger::instance().error(report.summary());
    }
    return report;
}
