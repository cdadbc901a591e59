#include "../framework/SimpleTest.hpp"
#include "backend/MediaDecoder.hpp"
#include "util/FormatDetector.hpp"
#include <atomic>
#include <future>
#include <stdexcept>

using namespace tessera::util;

TEST_CASE(test_detector_memoizes_probe) {
    std::atomic<int> calls{0};
    FormatDetector detector([&calls] {
        calls++;
        return true;
    });
    ASSERT_TRUE(detector.wait());
    ASSERT_TRUE(detector.detect());
    ASSERT_TRUE(detector.wait());
    ASSERT_EQ(calls.load(), 1);
}

TEST_CASE(test_detector_false_until_resolved) {
    std::promise<void> gate;
    auto released = gate.get_future().share();
    FormatDetector detector([released] {
        released.wait();
        return true;
    });

    detector.start();
    ASSERT_FALSE(detector.detect());
    gate.set_value();
    ASSERT_TRUE(detector.wait());
    ASSERT_TRUE(detector.detect());
}

TEST_CASE(test_detector_probe_exception_means_unsupported) {
    FormatDetector detector([]() -> bool { throw std::runtime_error("no decoder"); });
    ASSERT_FALSE(detector.wait());
    ASSERT_FALSE(detector.detect());
}

TEST_CASE(test_detector_webp_probe) {
    // The linked libwebp decodes WebP, so the embedded probe image must decode
    ASSERT_TRUE(FormatDetector::probe_webp());
    FormatDetector detector;
    ASSERT_TRUE(detector.wait());
}

TEST_CASE(test_decoder_inspects_png_header) {
    // 1x1 RGBA PNG
    const std::vector<uint8_t> png = {
        0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A, 0x00, 0x00, 0x00, 0x0D,
        0x49, 0x48, 0x44, 0x52, 0x00, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00, 0x01,
        0x08, 0x06, 0x00, 0x00, 0x00, 0x1F, 0x15, 0xC4, 0x89, 0x00, 0x00, 0x00,
        0x0D, 0x49, 0x44, 0x41, 0x54, 0x78, 0x9C, 0x63, 0x00, 0x01, 0x00, 0x00,
        0x05, 0x00, 0x01, 0x0D, 0x0A, 0x2D, 0xB4, 0x00, 0x00, 0x00, 0x00, 0x49,
        0x45, 0x4E, 0x44, 0xAE, 0x42, 0x60, 0x82,
    };
    auto info = tessera::backend::MediaDecoder::inspect(png);
    ASSERT_TRUE(info.has_value());
    ASSERT_EQ(info->width, 1);
    ASSERT_EQ(info->height, 1);
    ASSERT_EQ(info->mime_type, std::string("image/png"));
}

TEST_CASE(test_decoder_rejects_garbage) {
    const std::vector<uint8_t> junk = {'<', 'h', 't', 'm', 'l', '>'};
    ASSERT_FALSE(tessera::backend::MediaDecoder::inspect(junk).has_value());
    ASSERT_FALSE(tessera::backend::MediaDecoder::inspect({}).has_value());
}

int main() {
    return tessera::test::TestRunner::instance().run_all();
}
