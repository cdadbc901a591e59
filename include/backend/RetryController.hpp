#pragma once

#include "backend/LoadScheduler.hpp"
#include "backend/LoadedRegistry.hpp"
#include "events/EventLoop.hpp"
#include "model/LoadAttempt.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace tessera::backend {

struct RetryPolicy {
    // Backoff doubles per retry; larger values are clamped
    static constexpr int MAX_RETRIES_LIMIT = 10;

    int max_retries = 2;
    std::chrono::milliseconds base_delay{500};
    std::string fallback_url = "/images/fallback.jpeg";
};

/**
 * Drives one consumer's desired resource through the scheduler.
 *
 *   Idle -> Requesting -> Succeeded
 *                      -> (failure) retry after base_delay * 2^n with a
 *                         cache-busted URL, up to max_retries times
 *                      -> fallback URL, exactly once
 *                      -> Failed (fallback still displayed if it loaded)
 *
 * Unsupported resources skip the retries and go straight to the fallback;
 * blank sources never issue a request for the original at all.
 *
 * Every callback carries the generation it was issued for and is dropped
 * if the consumer has since asked for something else, so a slow response
 * for an old URL can never overwrite a newer one.
 */
class RetryController {
public:
    using Listener = std::function<void(const model::DisplayState&)>;

    RetryController(LoadScheduler& scheduler,
                    LoadedRegistry& registry,
                    events::EventLoop& loop,
                    RetryPolicy policy,
                    int priority = 5);
    ~RetryController();

    RetryController(const RetryController&) = delete;
    RetryController& operator=(const RetryController&) = delete;

    // The consumer wants to display `url` now; supersedes any earlier request
    void set_source(const std::string& url);

    // Consumer is going away; nothing issued so far may touch it any more
    void teardown();

    void on_change(Listener listener) { listener_ = std::move(listener); }

    const model::DisplayState& state() const { return display_; }
    const model::LoadAttempt& attempt() const { return attempt_; }
    int priority() const { return priority_; }
    const RetryPolicy& policy() const { return policy_; }

    static std::string cache_busted(const std::string& url, int retry, std::chrono::milliseconds stamp);

private:
    void request(const std::string& source);
    void handle_result(uint64_t generation, const model::LoadResult& result);
    void handle_failure(const model::LoadError& error);
    void switch_to_fallback();
    void finish_failed();
    void cancel_outstanding();
    void publish();

    LoadScheduler& scheduler_;
    LoadedRegistry& registry_;
    events::EventLoop& loop_;
    RetryPolicy policy_;
    int priority_;

    model::LoadAttempt attempt_;
    model::DisplayState display_;
    uint64_t generation_ = 0;

    std::optional<LoadScheduler::Ticket> ticket_;
    std::optional<events::EventLoop::TimerId> backoff_timer_;
    Listener listener_;

    std::shared_ptr<bool> alive_;
};

}  // namespace tessera::backend
