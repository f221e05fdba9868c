#pragma once
#include <string>

enum class ContentKind { Image, Audio, Video, Unknown };

struct ContentClass {
    ContentKind kind = ContentKind::Unknown;
    std::string suffix;   // without the dot; empty when unknown
};

/// Map a Content-Type header value to a coarse kind and a file suffix.
/// Parameters ("; charset=...") and letter case are ignored.
/// With legacy_mapping, video/mp4 is classified as a PNG image, matching
/// the file names of the legacy layout.
ContentClass classifyContentType(const std::string& content_type,
                                 bool legacy_mapping = false);

const char* contentKindName(ContentKind kind);

/// "base.suffix", or just "base" when suffix is empty.
std::string destinationFor(const std::string& base, const std::string& suffix);
