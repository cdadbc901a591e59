#include "../framework/SimpleTest.hpp"
#include "../framework/ManualClock.hpp"
#include "../framework/StubMediaSource.hpp"
#include "backend/RetryController.hpp"
#include <memory>
#include <vector>

using namespace tessera::backend;
using namespace tessera::model;
using tessera::events::EventLoop;
using tessera::test::ManualClock;
using tessera::test::StubMediaSource;
using namespace std::chrono_literals;

namespace {

const std::string FALLBACK = "/images/fallback.jpeg";
const std::string TARGET = "https://img.example.test/photos/42.jpg";

struct Fixture {
    ManualClock clock;
    EventLoop loop{clock};
    StubMediaSource source;
    MediaCache cache{clock, 100, 60000ms};
    LoadedRegistry registry{100};
    LoadScheduler scheduler{source, cache, registry, loop, SchedulerOptions{}};
    std::unique_ptr<RetryController> controller;
    std::vector<DisplayState> published;

    explicit Fixture(RetryPolicy policy = {}) {
        controller = std::make_unique<RetryController>(scheduler, registry, loop, policy);
        controller->on_change([this](const DisplayState& s) { published.push_back(s); });
    }

    void drain() {
        for (int i = 0; i < 8; ++i) loop.process();
    }
};

}  // namespace

TEST_CASE(test_retry_success_first_try) {
    Fixture f;
    f.source.outcomes[TARGET] = StubMediaSource::Outcome::Succeed;
    f.controller->set_source(TARGET);
    ASSERT_TRUE(f.controller->state().state == AttemptState::Requesting);
    f.drain();

    const auto& state = f.controller->state();
    ASSERT_TRUE(state.state == AttemptState::Succeeded);
    ASSERT_TRUE(state.handle != nullptr);
    ASSERT_FALSE(state.showing_fallback);
    ASSERT_FALSE(state.error);
    ASSERT_EQ(state.source, TARGET);
    ASSERT_TRUE(f.registry.is_marked(TARGET));
    ASSERT_EQ(f.source.requests.size(), 1u);
}

TEST_CASE(test_retry_backoff_sequence_then_fallback) {
    Fixture f;
    f.source.default_outcome = StubMediaSource::Outcome::Fail;
    f.source.outcomes[FALLBACK] = StubMediaSource::Outcome::Succeed;

    f.controller->set_source(TARGET);
    f.drain();
    ASSERT_EQ(f.source.requests.size(), 1u);
    ASSERT_EQ(f.controller->attempt().retries_used, 1);

    f.clock.advance(499ms);
    f.drain();
    ASSERT_EQ(f.source.requests.size(), 1u);
    f.clock.advance(1ms);
    f.drain();
    ASSERT_EQ(f.source.requests.size(), 2u);
    ASSERT_TRUE(f.source.requests[1].rfind(TARGET + "?retry=1-", 0) == 0);

    f.clock.advance(999ms);
    f.drain();
    ASSERT_EQ(f.source.requests.size(), 2u);
    f.clock.advance(1ms);
    f.drain();

    // Second retry fails, retries are exhausted, fallback follows at once
    ASSERT_EQ(f.source.requests.size(), 4u);
    ASSERT_TRUE(f.source.requests[2].rfind(TARGET + "?retry=2-", 0) == 0);
    ASSERT_EQ(f.source.requests[3], FALLBACK);

    const auto& state = f.controller->state();
    ASSERT_TRUE(state.terminal());
    ASSERT_TRUE(state.state == AttemptState::Failed);
    ASSERT_TRUE(state.showing_fallback);
    ASSERT_TRUE(state.error);
    ASSERT_TRUE(state.handle != nullptr);
    ASSERT_EQ(state.handle->url, FALLBACK);
    ASSERT_EQ(state.retries_used, 2);
    ASSERT_FALSE(f.registry.is_marked(TARGET));
}

TEST_CASE(test_retry_recovers_on_second_attempt) {
    Fixture f;
    f.controller->set_source(TARGET);
    f.drain();
    ASSERT_TRUE(f.source.fail(TARGET));

    f.clock.advance(500ms);
    f.drain();
    ASSERT_EQ(f.source.requests.size(), 2u);
    ASSERT_TRUE(f.source.resolve(f.source.requests[1]));

    const auto& state = f.controller->state();
    ASSERT_TRUE(state.state == AttemptState::Succeeded);
    ASSERT_EQ(state.retries_used, 1);
    ASSERT_FALSE(state.showing_fallback);
    // The desired resource is recorded, not only the cache-busted variant
    ASSERT_TRUE(f.registry.is_marked(TARGET));
}

TEST_CASE(test_retry_stale_result_suppressed) {
    Fixture f;
    const std::string other = "https://img.example.test/photos/43.jpg";

    f.controller->set_source(TARGET);
    f.drain();
    f.controller->set_source(other);
    f.drain();
    ASSERT_TRUE(f.source.resolve(other));
    ASSERT_TRUE(f.controller->state().state == AttemptState::Succeeded);
    ASSERT_EQ(f.controller->state().source, other);

    size_t published = f.published.size();
    ASSERT_TRUE(f.source.resolve(TARGET));
    ASSERT_EQ(f.controller->state().source, other);
    ASSERT_EQ(f.controller->state().handle->url, other);
    ASSERT_EQ(f.published.size(), published);
}

TEST_CASE(test_retry_stale_failure_suppressed) {
    Fixture f;
    const std::string other = "https://img.example.test/photos/43.jpg";

    f.controller->set_source(TARGET);
    f.drain();
    f.controller->set_source(other);
    f.drain();
    ASSERT_TRUE(f.source.fail(TARGET));
    f.clock.advance(5s);
    f.drain();

    // No retry was scheduled for the superseded resource
    ASSERT_EQ(f.source.count_requests(TARGET), 1u);
    ASSERT_EQ(f.controller->attempt().retries_used, 0);
    ASSERT_TRUE(f.controller->state().state == AttemptState::Requesting);
}

TEST_CASE(test_retry_change_cancels_pending_backoff) {
    Fixture f;
    const std::string other = "https://img.example.test/photos/43.jpg";

    f.controller->set_source(TARGET);
    f.drain();
    f.source.fail(TARGET);
    f.controller->set_source(other);
    f.clock.advance(5s);
    f.drain();
    ASSERT_EQ(f.source.count_requests(TARGET), 1u);
    ASSERT_EQ(f.source.count_requests(other), 1u);
}

TEST_CASE(test_retry_generation_increments) {
    Fixture f;
    f.controller->set_source(TARGET);
    auto first = f.controller->attempt().generation;
    f.controller->set_source(TARGET);
    ASSERT_TRUE(f.controller->attempt().generation > first);
}

TEST_CASE(test_retry_unsupported_skips_retries) {
    Fixture f;
    f.source.outcomes[TARGET] = StubMediaSource::Outcome::Unsupported;
    f.source.outcomes[FALLBACK] = StubMediaSource::Outcome::Succeed;
    f.controller->set_source(TARGET);
    f.drain();

    ASSERT_EQ(f.source.requests.size(), 2u);
    ASSERT_EQ(f.source.requests[1], FALLBACK);
    ASSERT_EQ(f.controller->attempt().retries_used, 0);
    ASSERT_TRUE(f.controller->state().showing_fallback);
    ASSERT_TRUE(f.controller->state().handle != nullptr);
}

TEST_CASE(test_retry_blank_source_goes_to_fallback) {
    Fixture f;
    f.source.outcomes[FALLBACK] = StubMediaSource::Outcome::Succeed;
    f.controller->set_source("   ");
    f.drain();

    ASSERT_EQ(f.source.requests.size(), 1u);
    ASSERT_EQ(f.source.requests[0], FALLBACK);
    ASSERT_TRUE(f.controller->state().state == AttemptState::Failed);
    ASSERT_TRUE(f.controller->state().showing_fallback);
    ASSERT_TRUE(f.controller->state().error);
}

TEST_CASE(test_retry_fallback_failure_is_terminal) {
    RetryPolicy policy;
    policy.max_retries = 0;
    Fixture f(policy);
    f.source.default_outcome = StubMediaSource::Outcome::Fail;
    f.controller->set_source(TARGET);
    f.drain();

    ASSERT_EQ(f.source.requests.size(), 2u);
    const auto& state = f.controller->state();
    ASSERT_TRUE(state.state == AttemptState::Failed);
    ASSERT_TRUE(state.showing_fallback);
    ASSERT_TRUE(state.handle == nullptr);

    // Nothing further is tried
    f.clock.advance(10s);
    f.drain();
    ASSERT_EQ(f.source.requests.size(), 2u);
}

TEST_CASE(test_retry_without_fallback_url) {
    RetryPolicy policy;
    policy.fallback_url = "";
    Fixture f(policy);
    f.controller->set_source("null");
    ASSERT_TRUE(f.controller->state().state == AttemptState::Failed);
    ASSERT_TRUE(f.controller->state().error);
    ASSERT_EQ(f.source.requests.size(), 0u);
}

TEST_CASE(test_retry_timeout_counts_as_transient) {
    Fixture f;
    f.controller->set_source(TARGET);
    f.drain();
    ASSERT_TRUE(f.source.fail(TARGET, LoadErrorKind::Timeout));
    ASSERT_EQ(f.controller->attempt().retries_used, 1);
    ASSERT_FALSE(f.controller->state().showing_fallback);
}

TEST_CASE(test_retry_teardown_ignores_late_results) {
    Fixture f;
    f.controller->set_source(TARGET);
    f.drain();
    f.controller->teardown();
    size_t published = f.published.size();

    ASSERT_TRUE(f.source.resolve(TARGET));
    ASSERT_EQ(f.published.size(), published);
    ASSERT_TRUE(f.controller->state().state == AttemptState::Idle);
}

TEST_CASE(test_retry_destroyed_with_backoff_pending) {
    Fixture f;
    f.controller->set_source(TARGET);
    f.drain();
    f.source.fail(TARGET);
    ASSERT_EQ(f.loop.pending_timers(), 1u);

    f.controller.reset();
    ASSERT_EQ(f.loop.pending_timers(), 0u);
    f.clock.advance(5s);
    f.drain();
    ASSERT_EQ(f.source.requests.size(), 1u);
}

TEST_CASE(test_retry_listener_switching_source_drops_fallback) {
    Fixture f;
    const std::string next = "https://img.example.test/photos/43.jpg";
    f.source.outcomes[TARGET] = StubMediaSource::Outcome::Unsupported;

    // Skip to the next photo as soon as the fallback is about to show
    bool switched = false;
    f.controller->on_change([&](const DisplayState& s) {
        if (s.showing_fallback && !switched) {
            switched = true;
            f.controller->set_source(next);
        }
    });

    f.controller->set_source(TARGET);
    f.drain();

    ASSERT_TRUE(switched);
    ASSERT_EQ(f.source.count_requests(FALLBACK), 0u);
    ASSERT_EQ(f.source.count_requests(next), 1u);
    ASSERT_EQ(f.controller->attempt().target_key, next);
    ASSERT_TRUE(f.controller->state().state == AttemptState::Requesting);
    ASSERT_FALSE(f.controller->state().showing_fallback);
    ASSERT_FALSE(f.registry.is_marked(next));

    ASSERT_TRUE(f.source.resolve(next));
    ASSERT_TRUE(f.controller->state().state == AttemptState::Succeeded);
    ASSERT_EQ(f.controller->state().handle->url, next);
}

TEST_CASE(test_retry_listener_switching_source_during_retry) {
    Fixture f;
    const std::string next = "https://img.example.test/photos/43.jpg";

    bool switched = false;
    f.controller->on_change([&](const DisplayState& s) {
        if (s.source.rfind(TARGET + "?retry=1-", 0) == 0 && !switched) {
            switched = true;
            f.controller->set_source(next);
        }
    });

    f.controller->set_source(TARGET);
    f.drain();
    ASSERT_TRUE(f.source.fail(TARGET));
    f.clock.advance(500ms);
    f.drain();

    // The cache-busted retry for TARGET was withdrawn before it reached the source
    ASSERT_TRUE(switched);
    ASSERT_EQ(f.source.requests.size(), 2u);
    ASSERT_EQ(f.source.requests[1], next);
    ASSERT_EQ(f.controller->attempt().retries_used, 0);
}

TEST_CASE(test_retry_max_retries_clamped) {
    RetryPolicy policy;
    policy.max_retries = 1000;
    policy.base_delay = 1ms;
    Fixture f(policy);
    ASSERT_EQ(f.controller->policy().max_retries, RetryPolicy::MAX_RETRIES_LIMIT);

    f.source.default_outcome = StubMediaSource::Outcome::Fail;
    f.source.outcomes[FALLBACK] = StubMediaSource::Outcome::Succeed;
    f.controller->set_source(TARGET);
    for (int i = 0; i < 2 * RetryPolicy::MAX_RETRIES_LIMIT; ++i) {
        f.clock.advance(1s);
        f.drain();
    }

    ASSERT_EQ(f.controller->attempt().retries_used, RetryPolicy::MAX_RETRIES_LIMIT);
    ASSERT_EQ(f.source.requests.size(), static_cast<size_t>(RetryPolicy::MAX_RETRIES_LIMIT) + 2);
    ASSERT_EQ(f.source.requests.back(), FALLBACK);
    ASSERT_TRUE(f.controller->state().showing_fallback);
    ASSERT_TRUE(f.controller->state().handle != nullptr);
}

TEST_CASE(test_retry_negative_max_retries) {
    RetryPolicy policy;
    policy.max_retries = -4;
    Fixture f(policy);
    ASSERT_EQ(f.controller->policy().max_retries, 0);
}

TEST_CASE(test_retry_same_source_served_from_cache) {
    Fixture f;
    f.source.outcomes[TARGET] = StubMediaSource::Outcome::Succeed;
    f.controller->set_source(TARGET);
    f.drain();

    RetryController second(f.scheduler, f.registry, f.loop, RetryPolicy{});
    second.set_source(TARGET);
    f.drain();

    ASSERT_TRUE(second.state().state == AttemptState::Succeeded);
    ASSERT_TRUE(second.state().handle == f.controller->state().handle);
    ASSERT_EQ(f.source.count_requests(TARGET), 1u);
}

TEST_CASE(test_retry_cache_busted_suffix) {
    using std::chrono::milliseconds;
    ASSERT_EQ(RetryController::cache_busted("https://a.test/x.jpg", 1, milliseconds(1234)),
              std::string("https://a.test/x.jpg?retry=1-1234"));
    ASSERT_EQ(RetryController::cache_busted("https://a.test/x.jpg?w=400", 2, milliseconds(99)),
              std::string("https://a.test/x.jpg?w=400&retry=2-99"));
}

TEST_CASE(test_retry_publishes_transitions) {
    Fixture f;
    f.source.outcomes[TARGET] = StubMediaSource::Outcome::Succeed;
    f.controller->set_source(TARGET);
    f.drain();
    ASSERT_EQ(f.published.size(), 2u);
    ASSERT_TRUE(f.published[0].state == AttemptState::Requesting);
    ASSERT_TRUE(f.published[1].state == AttemptState::Succeeded);
}

int main() {
    return tessera::test::TestRunner::instance().run_all();
}
