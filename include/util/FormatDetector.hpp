#pragma once

#include <functional>
#include <future>
#include <mutex>

namespace tessera::util {

// One-shot, memoized probe of whether this runtime can decode WebP.
// The probe runs asynchronously on first use; until it resolves, detect()
// answers a conservative false.
class FormatDetector {
public:
    using Probe = std::function<bool()>;

    FormatDetector();
    explicit FormatDetector(Probe probe);

    // Starts the probe if it has not been started yet
    void start();

    // Memoized answer; false while the probe is still running
    bool detect();

    // Blocks until the probe has resolved
    bool wait();

    // Decodes a 1x1 WebP embedded in the binary
    static bool probe_webp();

private:
    Probe probe_;
    std::once_flag started_;
    std::shared_future<bool> result_;
};

}  // namespace tessera::util
