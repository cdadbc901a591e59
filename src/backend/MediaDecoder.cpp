#include "backend/MediaDecoder.hpp"
#include <webp/decode.h>
#include <cstring>

// stb_image for JPEG/PNG/GIF/BMP header parsing
#define STBI_ONLY_JPEG
#define STBI_ONLY_PNG
#define STBI_ONLY_GIF
#define STBI_ONLY_BMP
#define STBI_NO_HDR
#define STBI_NO_LINEAR
#define STB_IMAGE_STATIC
#define STB_IMAGE_IMPLEMENTATION
#include "stb/stb_image.h"

namespace tessera::backend {

namespace {

std::string sniff_mime(const std::vector<uint8_t>& data) {
    if (data.size() >= 3 && data[0] == 0xFF && data[1] == 0xD8 && data[2] == 0xFF) return "image/jpeg";
    if (data.size() >= 8 && std::memcmp(data.data(), "\x89PNG\r\n\x1a\n", 8) == 0) return "image/png";
    if (data.size() >= 6 && std::memcmp(data.data(), "GIF8", 4) == 0) return "image/gif";
    if (data.size() >= 2 && data[0] == 'B' && data[1] == 'M') return "image/bmp";
    return "application/octet-stream";
}

}  // namespace

bool MediaDecoder::is_webp(const std::vector<uint8_t>& data) {
    return data.size() >= 12 &&
           std::memcmp(data.data(), "RIFF", 4) == 0 &&
           std::memcmp(data.data() + 8, "WEBP", 4) == 0;
}

std::optional<ImageInfo> MediaDecoder::inspect(const std::vector<uint8_t>& data) {
    if (data.empty()) {
        return std::nullopt;
    }

    ImageInfo info;
    if (is_webp(data)) {
        if (!WebPGetInfo(data.data(), data.size(), &info.width, &info.height)) {
            return std::nullopt;
        }
        info.mime_type = "image/webp";
        return info;
    }

    int channels = 0;
    if (!stbi_info_from_memory(data.data(), static_cast<int>(data.size()), &info.width, &info.height, &channels)) {
        return std::nullopt;
    }
    info.mime_type = sniff_mime(data);
    return info;
}

}  // namespace tessera::backend
