#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tessera::backend {

struct ImageInfo {
    int width = 0;
    int height = 0;
    std::string mime_type;
};

// Header-level validation of fetched image bytes. Nothing is fully decoded:
// the point is to reject payloads the renderer could not draw (HTML error
// pages served with 200, truncated files, unknown formats).
class MediaDecoder {
public:
    static std::optional<ImageInfo> inspect(const std::vector<uint8_t>& data);
    static bool is_webp(const std::vector<uint8_t>& data);
};

}  // namespace tessera::backend
