#include "planner.h"
#include "block_splitter.h"
#include "content_kind.h"
#include "errors.h"
#include "logger.h"

#include <limits>

PlanOptions PlanOptions::legacy() {
    PlanOptions options;
    options.scheme = PartitionScheme::Legacy;
    options.legacy_content_mapping = true;
    options.honor_range_support = false;
    return options;
}

int64_t parseContentLength(const ResourceMetadata& metadata) {
    auto value = metadata.header("content-length");
    if (!value) {
        throw DownloadError(ErrorKind::MissingLength, "response has no Content-Length header");
    }

    const std::string& text = *value;
    if (text.empty()) {
        throw DownloadError(ErrorKind::InvalidLength, "empty Content-Length header");
    }

    constexpr int64_t kMax = std::numeric_limits<int64_t>::max();
    int64_t length = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            throw DownloadError(ErrorKind::InvalidLength, "invalid Content-Length \"" + text + "\"");
        }
        int digit = c - '0';
        if (length > (kMax - digit) / 10) {
            throw DownloadError(ErrorKind::InvalidLength, "Content-Length out of range \"" + text + "\"");
        }
        length = length * 10 + digit;
    }
    return length;
}

ResourcePlan buildPlan(const ResourceMetadata& metadata,
                       const std::string& url,
                       const std::string& save_base,
                       int parallelism,
                       const PlanOptions& options) {
    if (parallelism < 1 || parallelism > kMaxParallelism) {
        throw DownloadError(ErrorKind::InvalidParallelism,
                            "parallelism must be in [1, " + std::to_string(kMaxParallelism)
                            + "], got " + std::to_string(parallelism));
    }

    int64_t total_length = parseContentLength(metadata);
    if (total_length == 0) {
        throw DownloadError(ErrorKind::EmptyResource, "resource is empty (Content-Length: 0)");
    }

    ResourcePlan plan;
    plan.source_url = metadata.final_url.empty() ? url : metadata.final_url;
    plan.total_length = total_length;
    plan.requested_parallelism = parallelism;
    plan.scheme = options.scheme;
    plan.supports_partial_fetch = metadata.acceptsByteRanges();

    ContentClass content = classifyContentType(metadata.header("content-type").value_or(""),
                                               options.legacy_content_mapping);
    plan.content_kind = content.kind;
    plan.suffix = content.suffix;
    plan.destination_path = destinationFor(save_base, content.suffix);

    if (options.honor_range_support && !plan.supports_partial_fetch) {
        Logger::instance().warn("Server does not advertise byte ranges; fetching "
            + plan.source_url + " as a single block");
        plan.ranged_fetch = false;
        plan.blocks = wholeResourceBlock(total_length);
    } else {
        plan.ranged_fetch = true;
        plan.blocks = splitBlocks(total_length, parallelism, options.scheme);
    }

    Logger::instance().info("Planned " + std::to_string(plan.blocks.size()) + " block(s) for "
        + std::to_string(total_length) + " bytes -> " + plan.destination_path);
    return plan;
}
