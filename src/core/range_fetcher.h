#pragma once

#include <cstdint>
#include <string>

#include "http_engine.h"

/// Source of block bytes. Implementations must be callable from several
/// worker threads at once.
class RangeFetcher {
public:
    virtual ~RangeFetcher() = default;

    /// Hand the bytes of url in [range_start, range_end] to on_data in order,
    /// chunk by chunk. Returns the number of bytes delivered.
    /// @throws DownloadError (TransportError / UnexpectedStatus), or whatever
    ///         on_data throws.
    virtual int64_t streamRange(const std::string& url, const RangeRequest& request,
                                DataCallback on_data) = 0;

    /// Buffered form of streamRange().
    std::string fetchRange(const std::string& url, const RangeRequest& request);
};

/// RangeFetcher over libcurl: a fresh HttpEngine (easy handle) per call.
class HttpRangeFetcher : public RangeFetcher {
public:
    explicit HttpRangeFetcher(HttpConfig config);

    int64_t streamRange(const std::string& url, const RangeRequest& request,
                        DataCallback on_data) override;

private:
    HttpConfig config_;
};
