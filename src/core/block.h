#pragma once

#include <string>
#include <cstdint>
#include <atomic>
#include <functional>
#include <optional>

#include "errors.h"
#include "http_engine.h"
#include "resource_plan.h"

class OutputFile;
class RangeFetcher;

/// Pending -> Fetching -> Writing -> Completed; Failed from Fetching or Writing.
/// Fetching lasts until the first chunk arrives; Writing while chunks stream to disk.
enum class BlockState { Pending, Fetching, Writing, Completed, Failed };

const char* blockStateName(BlockState state);

struct BlockFailure {
    int block_id = 0;
    ErrorKind kind = ErrorKind::TransportError;
    std::string message;
};

using BlockWrittenCallback = std::function<void(int block_id, int64_t bytes)>;

class Block {
public:
    Block(BlockInfo info,
          const ResourcePlan& plan,
          RangeFetcher* fetcher,
          OutputFile* output,
          BlockWrittenCallback on_written);

    Block(const Block&) = delete;
    Block& operator=(const Block&) = delete;

    /// Stream the range into the output file at range_start (called from a pool worker).
    /// Never throws: a failure is recorded and false is returned.
    bool execute();

    BlockState state() const { return state_.load(); }

    /// Snapshot of the block; completed is set once execute() succeeded.
    BlockInfo getInfo() const;

    /// Set when execute() failed.
    const std::optional<BlockFailure>& failure() const { return failure_; }

private:
    RangeRequest makeRequest() const;
    void fail(ErrorKind kind, const std::string& message);

    BlockInfo info_;
    std::string url_;
    bool ranged_;
    int64_t total_length_;
    RangeFetcher* fetcher_;   // non-owning
    OutputFile* output_;      // non-owning, shared by all blocks
    BlockWrittenCallback on_written_;
    std::atomic<BlockState> state_{BlockState::Pending};
    std::optional<BlockFailure> failure_;
};
