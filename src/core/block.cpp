#include "block.h"
#include "logger.h"
#include "output_file.h"
#include "range_fetcher.h"

const char* blockStateName(BlockState state)
{
    switch (state) {
        case BlockState::Pending:   return "pending";
        case BlockState::Fetching:  return "fetching";
        case BlockState::Writing:   return "writing";
        case BlockState::Completed: return "completed";
        case BlockState::Failed:    return "failed";
    }
    return "unknown";
}

Block::Block(BlockInfo info,
             const ResourcePlan& plan,
             RangeFetcher* fetcher,
             OutputFile* output,
             BlockWrittenCallback on_written)
    : info_(std::move(info))
    , url_(plan.source_url)
    , ranged_(plan.ranged_fetch)
    , total_length_(plan.total_length)
    , fetcher_(fetcher)
    , output_(output)
    , on_written_(std::move(on_written))
{
}

bool Block::execute()
{
    if (state_.load() != BlockState::Pending) {
        return state_.load() == BlockState::Completed;
    }

    const std::string tag = "Block " + std::to_string(info_.block_id);
    RangeRequest request = makeRequest();

    // Chunks go straight to their offset in the shared file as they arrive.
    state_.store(BlockState::Fetching);
    int64_t received = 0;
    try {
        fetcher_->streamRange(url_, request, [this, &received](const char* data, size_t size) {
            if (received + static_cast<int64_t>(size) > info_.length()) {
                throw DownloadError(ErrorKind::TransportError,
                                    "more than " + std::to_string(info_.length())
                                    + " bytes received");
            }
            state_.store(BlockState::Writing);
            output_->write(data, size, info_.range_start + received);
            received += static_cast<int64_t>(size);
            return size;
        });
    } catch (const DownloadError& e) {
        fail(e.kind(), e.what());
        return false;
    } catch (const std::exception& e) {
        fail(received > 0 ? ErrorKind::IOError : ErrorKind::TransportError, e.what());
        return false;
    }

    if (received != info_.length()) {
        fail(ErrorKind::TransportError,
             "received " + std::to_string(received) + " bytes, expected "
             + std::to_string(info_.length()));
        return false;
    }

    state_.store(BlockState::Completed);
    if (on_written_) {
        on_written_(info_.block_id, received);
    }
    Logger::instance().info(tag + " done [" + std::to_string(info_.range_start)
        + ", " + std::to_string(info_.range_end) + "], " + std::to_string(received) + " bytes");
    return true;
}

BlockInfo Block::getInfo() const
{
    BlockInfo snapshot = info_;
    snapshot.completed = state_.load() == BlockState::Completed;
    return snapshot;
}

RangeRequest Block::makeRequest() const
{
    RangeRequest request;
    request.range_start = info_.range_start;
    request.range_end = info_.range_end;
    request.ranged = ranged_;
    request.covers_whole_resource =
        info_.range_start == 0 && info_.range_end == total_length_ - 1;
    return request;
}

void Block::fail(ErrorKind kind, const std::string& message)
{
    failure_ = BlockFailure{info_.block_id, kind, message};
    state_.store(BlockState::Failed);
    Logger::instance().error("Block " + std::to_string(info_.block_id) + " failed ("
        + errorKindName(kind) + "): " + message);
}
