#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include "errors.h"

/// Result of a metadata probe (HEAD request).
struct ResourceMetadata {
    long status = 0;
    std::string final_url;                      // URL after redirects
    std::map<std::string, std::string> headers; // lower-cased names, final response only

    /// Header value by (case-insensitive) name.
    std::optional<std::string> header(const std::string& name) const;

    /// True when the server advertises "Accept-Ranges: bytes".
    bool acceptsByteRanges() const;
};

/// Per-request HTTP configuration.
struct HttpConfig {
    int connect_timeout_sec = 30;
    int low_speed_limit = 1000;     // abort if speed drops below 1000 bytes/sec
    int low_speed_time = 60;        // ... for 60 seconds
    int max_redirects = 10;
    bool verify_ssl = true;
    std::string user_agent =
        "Mozilla/5.0 (X11; Linux x86_64; rv:12.0) Gecko/20100101 Firefox/12.0";
    std::string referer;
    std::string cookie;
};

/// One GET for a block. Inclusive bounds; ranged == false sends no Range header.
struct RangeRequest {
    int64_t range_start = 0;
    int64_t range_end = 0;
    bool ranged = true;
    bool covers_whole_resource = false;  // 200 OK is acceptable for a ranged request

    int64_t length() const { return range_end - range_start + 1; }
};

/// Data callback: receives a chunk, returns bytes consumed.
using DataCallback = std::function<size_t(const char* data, size_t size)>;

/// Process-wide libcurl initialisation; keep one alive for the program's lifetime.
class CurlGlobal {
public:
    CurlGlobal();
    ~CurlGlobal();

    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
};

/// Synchronous HTTP engine wrapping a libcurl easy handle (Pimpl).
/// Each instance owns one CURL handle – not thread-safe; use one per thread.
class HttpEngine {
public:
    HttpEngine();
    ~HttpEngine();

    HttpEngine(const HttpEngine&) = delete;
    HttpEngine& operator=(const HttpEngine&) = delete;

    /// Send a HEAD request and return the final response's headers.
    /// Falls back to a header-only GET when HEAD is answered with 403/405.
    /// @throws HttpError (TransportError / UnexpectedStatus)
    ResourceMetadata fetchFileInfo(const std::string& url, const HttpConfig& config);

    /// GET one byte range and hand its body to on_data chunk by chunk.
    ///
    /// The status (206, or 200 for a whole-resource or unranged request) and
    /// Content-Range are checked before the first chunk is handed over, and at
    /// most request.length() bytes are ever delivered. Returns the number of
    /// bytes delivered, which always equals request.length().
    /// An exception thrown by on_data aborts the transfer and is rethrown.
    /// @throws HttpError (TransportError / UnexpectedStatus)
    int64_t streamRange(const std::string& url,
                        const RangeRequest& request,
                        const HttpConfig& config,
                        DataCallback on_data);

    /// GET one byte range and return its body (streamRange into a buffer).
    /// @throws HttpError (TransportError / UnexpectedStatus)
    std::string fetchRange(const std::string& url,
                           const RangeRequest& request,
                           const HttpConfig& config);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/// Parse "bytes <first>-<last>/<total|*>". Returns false on malformed input.
bool parseContentRange(const std::string& value, int64_t& first, int64_t& last);
