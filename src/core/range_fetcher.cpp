#include "range_fetcher.h"

#include <utility>

std::string RangeFetcher::fetchRange(const std::string& url, const RangeRequest& request)
{
    std::string body;
    streamRange(url, request, [&body](const char* data, size_t size) {
        body.append(data, size);
        return size;
    });
    return body;
}

HttpRangeFetcher::HttpRangeFetcher(HttpConfig config)
    : config_(std::move(config))
{
}

int64_t HttpRangeFetcher::streamRange(const std::string& url, const RangeRequest& request,
                                      DataCallback on_data)
{
    HttpEngine engine;
    return engine.streamRange(url, request, config_, std::move(on_data));
}
