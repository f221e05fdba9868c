#include "http_engine.h"
#include "logger.h"

#include <algorithm>
#include <cctype>
#include <exception>
#include <curl/curl.h>

// ── Pimpl ──────────────────────────────────────────────────────

struct HttpEngine::Impl {
    CURL* curl = nullptr;
    struct curl_slist* headers = nullptr;

    Impl() {
        curl = curl_easy_init();
        if (!curl) {
            throw HttpError("Failed to initialise CURL easy handle");
        }
    }

    ~Impl() {
        freeHeaders();
        if (curl) {
            curl_easy_cleanup(curl);
        }
    }

    void freeHeaders() {
        if (headers) {
            curl_slist_free_all(headers);
            headers = nullptr;
        }
    }

    void reset() {
        curl_easy_reset(curl);
        freeHeaders();
    }

    // ── Common configuration applied to every request ──────────
    void applyConfig(const HttpConfig& config) {
        curl_easy_setopt(curl, CURLOPT_USERAGENT, config.user_agent.c_str());

        headers = curl_slist_append(headers, "Accept: */*");
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);

        curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);

        // Redirects
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_MAXREDIRS, static_cast<long>(config.max_redirects));

        // TLS
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, config.verify_ssl ? 1L : 0L);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, config.verify_ssl ? 2L : 0L);

        // Worker threads: never raise SIGALRM for DNS timeouts
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(config.connect_timeout_sec));

        // Low-speed abort: detect stalled connections
        if (config.low_speed_limit > 0) {
            curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, static_cast<long>(config.low_speed_limit));
            curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, static_cast<long>(config.low_speed_time));
        }

        if (!config.referer.empty()) {
            curl_easy_setopt(curl, CURLOPT_REFERER, config.referer.c_str());
        }
        if (!config.cookie.empty()) {
            curl_easy_setopt(curl, CURLOPT_COOKIE, config.cookie.c_str());
        }
    }
};

// ── Static helpers ─────────────────────────────────────────────

namespace {

/// Trim leading/trailing whitespace.
std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return {};
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

/// Parse a non-negative decimal integer; the whole string must be digits.
bool parseOffset(const std::string& s, int64_t& out) {
    if (s.empty() || s.size() > 18) return false;
    int64_t value = 0;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
        value = value * 10 + (c - '0');
    }
    out = value;
    return true;
}

// ── Header callback: collects the headers of the last response ─

size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
    size_t total = size * nitems;
    auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
    std::string line(buffer, total);

    // A new status line starts a new response (redirect hop); forget the old headers.
    if (line.compare(0, 5, "HTTP/") == 0) {
        headers->clear();
        return total;
    }

    auto colon = line.find(':');
    if (colon == std::string::npos) return total;

    (*headers)[toLower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
    return total;
}

// ── Range responses ────────────────────────────────────────────

bool statusAcceptable(const RangeRequest& request, long http_code) {
    if (request.ranged) {
        return http_code == 206 || (http_code == 200 && request.covers_whole_resource);
    }
    return http_code == 200;
}

std::string rangeText(const RangeRequest& request) {
    return std::to_string(request.range_start) + "-" + std::to_string(request.range_end);
}

/// Status and Content-Range of a range response.
/// @throws HttpError(UnexpectedStatus)
void checkRangeResponse(const RangeRequest& request, long http_code,
                        const std::map<std::string, std::string>& headers) {
    if (!statusAcceptable(request, http_code)) {
        std::string msg = "Unexpected HTTP status " + std::to_string(http_code);
        if (request.ranged) {
            msg += http_code == 200 ? " (Range " + rangeText(request) + " ignored)"
                                    : " for range " + rangeText(request);
        }
        throw HttpError(msg, 0, http_code, ErrorKind::UnexpectedStatus);
    }

    if (http_code != 206) {
        return;
    }
    auto it = headers.find("content-range");
    if (it == headers.end()) {
        return;
    }
    int64_t first = 0, last = 0;
    if (!parseContentRange(it->second, first, last)
        || first != request.range_start || last != request.range_end) {
        throw HttpError("Content-Range \"" + it->second + "\" does not match "
                        + rangeText(request), 0, http_code, ErrorKind::UnexpectedStatus);
    }
}

// ── Body write callback ────────────────────────────────────────

struct StreamContext {
    CURL* curl = nullptr;
    const RangeRequest* request = nullptr;
    const std::map<std::string, std::string>* headers = nullptr;
    DataCallback on_data;
    int64_t delivered = 0;
    bool checked = false;            // response validated on the first chunk
    std::exception_ptr error;        // raised inside the callback, rethrown after perform
};

size_t streamWriteCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<StreamContext*>(userdata);
    size_t total = size * nmemb;

    // Exceptions must not unwind through libcurl; park them and abort.
    try {
        if (!ctx->checked) {
            ctx->checked = true;
            long http_code = 0;
            curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &http_code);
            checkRangeResponse(*ctx->request, http_code, *ctx->headers);
        }

        if (ctx->delivered + static_cast<int64_t>(total) > ctx->request->length()) {
            throw HttpError("Response body exceeds " + std::to_string(ctx->request->length())
                            + " bytes", static_cast<int>(CURLE_WRITE_ERROR));
        }

        size_t consumed = ctx->on_data(ptr, total);
        ctx->delivered += static_cast<int64_t>(consumed);
        if (consumed != total) {
            throw DownloadError(ErrorKind::IOError,
                                "data callback consumed " + std::to_string(consumed)
                                + " of " + std::to_string(total) + " bytes");
        }
        return total;
    } catch (...) {
        ctx->error = std::current_exception();
        return 0; // returning less than total aborts the transfer
    }
}

/// Body callback for the GET-based probe: abort as soon as the body starts.
size_t discardBodyCallback(char*, size_t, size_t, void*) {
    return 0;
}

} // anonymous namespace

// ── ResourceMetadata ───────────────────────────────────────────

std::optional<std::string> ResourceMetadata::header(const std::string& name) const {
    auto it = headers.find(toLower(name));
    if (it == headers.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool ResourceMetadata::acceptsByteRanges() const {
    auto value = header("accept-ranges");
    return value && toLower(*value) == "bytes";
}

bool parseContentRange(const std::string& value, int64_t& first, int64_t& last) {
    std::string v = trim(value);
    if (toLower(v.substr(0, 6)) != "bytes ") return false;

    std::string spec = trim(v.substr(6));
    auto dash = spec.find('-');
    auto slash = spec.find('/');
    if (dash == std::string::npos || slash == std::string::npos || dash > slash) {
        return false;
    }
    return parseOffset(spec.substr(0, dash), first)
        && parseOffset(spec.substr(dash + 1, slash - dash - 1), last)
        && first <= last;
}

// ── CurlGlobal ─────────────────────────────────────────────────

CurlGlobal::CurlGlobal() {
    CURLcode res = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (res != CURLE_OK) {
        throw HttpError(std::string("curl_global_init failed: ") + curl_easy_strerror(res),
                        static_cast<int>(res));
    }
}

CurlGlobal::~CurlGlobal() {
    curl_global_cleanup();
}

// ── HttpEngine public API ──────────────────────────────────────

HttpEngine::HttpEngine() : impl_(std::make_unique<Impl>()) {}

HttpEngine::~HttpEngine() = default;

ResourceMetadata HttpEngine::fetchFileInfo(const std::string& url, const HttpConfig& config) {
    // Try HEAD first, fall back to GET if HEAD returns 403/405
    for (int method = 0; method < 2; ++method) {
        bool use_get = (method == 1);

        impl_->reset();
        CURL* curl = impl_->curl;

        ResourceMetadata meta;

        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, headerCallback);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &meta.headers);

        if (use_get) {
            curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
            curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, discardBodyCallback);
        } else {
            curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);  // HEAD
        }

        impl_->applyConfig(config);
        curl_easy_setopt(curl, CURLOPT_TIMEOUT, 60L);

        CURLcode res = curl_easy_perform(curl);

        long http_code = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);

        // For the GET fallback, CURLE_WRITE_ERROR is expected (we abort on purpose)
        if (use_get && res == CURLE_WRITE_ERROR && http_code > 0) {
            res = CURLE_OK;
        }

        if (res != CURLE_OK) {
            std::string msg = use_get ? "GET info failed: " : "HEAD request failed: ";
            msg += curl_easy_strerror(res);
            throw HttpError(msg, static_cast<int>(res), http_code);
        }

        if (http_code >= 400) {
            if (!use_get && (http_code == 403 || http_code == 405)) {
                Logger::instance().debug("HEAD answered " + std::to_string(http_code)
                    + ", retrying probe as GET: " + url);
                continue;
            }
            throw HttpError("HTTP error " + std::to_string(http_code) + " probing " + url,
                            0, http_code, ErrorKind::UnexpectedStatus);
        }

        meta.status = http_code;
        char* effective_url = nullptr;
        curl_easy_getinfo(curl, CURLINFO_EFFECTIVE_URL, &effective_url);
        meta.final_url = effective_url ? effective_url : url;
        return meta;
    }

    throw HttpError("Failed to fetch file info", 0, 403, ErrorKind::UnexpectedStatus);
}

int64_t HttpEngine::streamRange(const std::string& url,
                                const RangeRequest& request,
                                const HttpConfig& config,
                                DataCallback on_data) {
    impl_->reset();
    CURL* curl = impl_->curl;

    std::map<std::string, std::string> headers;
    StreamContext ctx;
    ctx.curl = curl;
    ctx.request = &request;
    ctx.headers = &headers;
    ctx.on_data = std::move(on_data);

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, streamWriteCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &headers);

    // Range header: "bytes=<start>-<end>"
    std::string range;
    if (request.ranged) {
        range = rangeText(request);
        curl_easy_setopt(curl, CURLOPT_RANGE, range.c_str());
    }

    impl_->applyConfig(config);

    CURLcode res = curl_easy_perform(curl);

    if (ctx.error) {
        std::rethrow_exception(ctx.error);
    }

    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);

    // A response arrived: judge its status before any transport error, so an
    // error page cut short still reports the status it carried.
    if (http_code > 0) {
        checkRangeResponse(request, http_code, headers);
    }

    if (res != CURLE_OK) {
        throw HttpError(std::string("Download failed: ") + curl_easy_strerror(res),
                        static_cast<int>(res), http_code);
    }

    if (ctx.delivered != request.length()) {
        throw HttpError("Short body: got " + std::to_string(ctx.delivered)
                        + " of " + std::to_string(request.length()) + " bytes",
                        0, http_code);
    }

    Logger::instance().debug("Range " + (request.ranged ? range : std::string("<whole>"))
        + " of " + url + ": HTTP " + std::to_string(http_code)
        + ", " + std::to_string(ctx.delivered) + " bytes");
    return ctx.delivered;
}

std::string HttpEngine::fetchRange(const std::string& url,
                                   const RangeRequest& request,
                                   const HttpConfig& config) {
    std::string body;
    streamRange(url, request, config, [&body](const char* data, size_t size) {
        body.append(data, size);
        return size;
    });
    return body;
}
