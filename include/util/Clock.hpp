#pragma once

#include <chrono>

namespace tessera::util {

// Time source shared by the cache (TTL), the event loop (timers) and the
// retry controller (cache-busting stamps). Tests substitute a manual clock.
class Clock {
public:
    using time_point = std::chrono::steady_clock::time_point;

    virtual ~Clock() = default;
    virtual time_point now() const = 0;
};

class SteadyClock : public Clock {
public:
    time_point now() const override { return std::chrono::steady_clock::now(); }
};

}  // namespace tessera::util
