#include "content_kind.h"
#include <algorithm>
#include <cctype>
#include <map>

// ── helpers ────────────────────────────────────────────────────

/// Return the media type in lower-case without parameters
/// (e.g. "Image/PNG; q=1" -> "image/png").
static std::string normalizeMediaType(const std::string& content_type) {
    std::string media = content_type.substr(0, content_type.find(';'));

    auto start = media.find_first_not_of(" \t");
    if (start == std::string::npos) return {};
    auto end = media.find_last_not_of(" \t");
    media = media.substr(start, end - start + 1);

    std::transform(media.begin(), media.end(), media.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return media;
}

static const std::map<std::string, ContentClass>& defaultTable() {
    static const std::map<std::string, ContentClass> table = {
        {"image/jpeg",      {ContentKind::Image, "jpg"}},
        {"image/png",       {ContentKind::Image, "png"}},
        {"audio/ogg",       {ContentKind::Audio, "ogg"}},
        {"application/ogg", {ContentKind::Audio, "ogg"}},
        {"video/mp4",       {ContentKind::Video, "mp4"}}
    };
    return table;
}

// ── public API ─────────────────────────────────────────────────

ContentClass classifyContentType(const std::string& content_type, bool legacy_mapping) {
    std::string media = normalizeMediaType(content_type);
    if (media.empty()) {
        return {};
    }

    if (legacy_mapping && media == "video/mp4") {
        return {ContentKind::Image, "png"};
    }

    const auto& table = defaultTable();
    auto it = table.find(media);
    if (it == table.end()) {
        return {};
    }
    return it->second;
}

const char* contentKindName(ContentKind kind) {
    switch (kind) {
        case ContentKind::Image:   return "image";
        case ContentKind::Audio:   return "audio";
        case ContentKind::Video:   return "video";
        case ContentKind::Unknown: return "unknown";
    }
    return "unknown";
}

std::string destinationFor(const std::string& base, const std::string& suffix) {
    if (suffix.empty()) {
        return base;
    }
    return base + "." + suffix;
}
