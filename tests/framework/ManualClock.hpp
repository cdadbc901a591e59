#pragma once

#include "util/Clock.hpp"
#include <chrono>

namespace tessera::test {

// Clock that only moves when a test says so
class ManualClock : public util::Clock {
public:
    time_point now() const override { return now_; }

    void advance(std::chrono::milliseconds delta) { now_ += delta; }

private:
    time_point now_ = time_point{} + std::chrono::hours(1);
};

}  // namespace tessera::test
