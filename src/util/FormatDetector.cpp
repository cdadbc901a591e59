#include "util/FormatDetector.hpp"
#include "util/Logger.hpp"
#include <webp/decode.h>
#include <chrono>
#include <cstdint>
#include <exception>

namespace tessera::util {

namespace {

// 1x1 lossy WebP
constexpr uint8_t WEBP_PROBE[] = {
    0x52, 0x49, 0x46, 0x46, 0x24, 0x00, 0x00, 0x00, 0x57, 0x45, 0x42, 0x50,
    0x56, 0x50, 0x38, 0x20, 0x18, 0x00, 0x00, 0x00, 0x30, 0x01, 0x00, 0x9D,
    0x01, 0x2A, 0x01, 0x00, 0x01, 0x00, 0x03, 0x00, 0x34, 0x25, 0xA4, 0x00,
    0x03, 0x70, 0x00, 0xFE, 0xFB, 0x94, 0x00, 0x00,
};

}  // namespace

FormatDetector::FormatDetector() : probe_(&FormatDetector::probe_webp) {}

FormatDetector::FormatDetector(Probe probe) : probe_(std::move(probe)) {}

bool FormatDetector::probe_webp() {
    int width = 0;
    int height = 0;
    uint8_t* rgba = WebPDecodeRGBA(WEBP_PROBE, sizeof(WEBP_PROBE), &width, &height);
    if (!rgba) {
        return false;
    }
    WebPFree(rgba);
    return width == 1 && height == 1;
}

void FormatDetector::start() {
    std::call_once(started_, [this] {
        result_ = std::async(std::launch::async, [probe = probe_] {
            try {
                bool supported = probe && probe();
                Logger::info(std::string("FormatDetector: WebP ") + (supported ? "supported" : "not supported"));
                return supported;
            } catch (const std::exception& e) {
                Logger::warn("FormatDetector: Probe failed: " + std::string(e.what()));
                return false;
            }
        }).share();
    });
}

bool FormatDetector::detect() {
    start();
    if (result_.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
        return false;
    }
    return result_.get();
}

bool FormatDetector::wait() {
    start();
    return result_.get();
}

}  // namespace tessera::util
