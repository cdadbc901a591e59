#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tessera::model {

enum class MediaType {
    Image,
    Gif,
    Video,
};

// A resolved media resource. Handles are immutable once built and shared
// between the cache and every consumer that asked for the same key.
struct MediaHandle {
    std::string url;
    std::vector<uint8_t> data;   // Encoded bytes as served (JPEG/PNG/WebP/MP4...)
    std::string mime_type;
    MediaType type = MediaType::Image;
    int width = 0;               // 0 when unknown (videos)
    int height = 0;
};

using MediaHandlePtr = std::shared_ptr<const MediaHandle>;

enum class LoadErrorKind {
    TransientLoadFailure,     // Retryable
    UnsupportedResourceType,  // Not retried, immediate fallback
    EmptyOrInvalidSource,     // Nothing was requested
    Timeout,                  // Fetch timeout expired; retried like a transient failure
};

struct LoadError {
    LoadErrorKind kind = LoadErrorKind::TransientLoadFailure;
    std::string message;

    bool retryable() const {
        return kind == LoadErrorKind::TransientLoadFailure || kind == LoadErrorKind::Timeout;
    }
};

const char* to_string(LoadErrorKind kind);

struct LoadResult {
    std::string key;
    MediaHandlePtr handle;
    std::optional<LoadError> error;

    bool ok() const { return !error.has_value() && handle != nullptr; }
};

}  // namespace tessera::model
