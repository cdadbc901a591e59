#include "backend/RetryController.hpp"
#include "url/UrlUtils.hpp"
#include "util/Logger.hpp"

namespace tessera::backend {

RetryController::RetryController(LoadScheduler& scheduler,
                                 LoadedRegistry& registry,
                                 events::EventLoop& loop,
                                 RetryPolicy policy,
                                 int priority)
    : scheduler_(scheduler),
      registry_(registry),
      loop_(loop),
      policy_(std::move(policy)),
      priority_(priority),
      alive_(std::make_shared<bool>(true)) {
    if (policy_.max_retries < 0) {
        policy_.max_retries = 0;
    } else if (policy_.max_retries > RetryPolicy::MAX_RETRIES_LIMIT) {
        util::Logger::warn("RetryController: max_retries " + std::to_string(policy_.max_retries) +
                           " too large, using " + std::to_string(RetryPolicy::MAX_RETRIES_LIMIT));
        policy_.max_retries = RetryPolicy::MAX_RETRIES_LIMIT;
    }
}

RetryController::~RetryController() {
    teardown();
    *alive_ = false;
}

std::string RetryController::cache_busted(const std::string& url, int retry, std::chrono::milliseconds stamp) {
    return url::append_query(url, "retry=" + std::to_string(retry) + "-" + std::to_string(stamp.count()));
}

void RetryController::set_source(const std::string& url) {
    cancel_outstanding();

    ++generation_;
    attempt_ = model::LoadAttempt{};
    attempt_.target_key = url;
    attempt_.generation = generation_;

    display_ = model::DisplayState{};
    display_.generation = generation_;

    if (url::is_blank_source(url)) {
        util::Logger::debug("RetryController: Blank source, showing fallback");
        switch_to_fallback();
        return;
    }

    request(url);
}

void RetryController::teardown() {
    cancel_outstanding();
    ++generation_;
    attempt_ = model::LoadAttempt{};
    attempt_.generation = generation_;
    display_ = model::DisplayState{};
    display_.generation = generation_;
}

void RetryController::cancel_outstanding() {
    if (backoff_timer_) {
        loop_.cancel(*backoff_timer_);
        backoff_timer_.reset();
    }
    if (ticket_) {
        // No-op once dispatched; the generation check handles that result
        scheduler_.cancel(*ticket_);
        ticket_.reset();
    }
}

void RetryController::request(const std::string& source) {
    attempt_.current_source = source;
    attempt_.state = model::AttemptState::Requesting;
    display_.state = model::AttemptState::Requesting;
    display_.source = source;

    // Submit before notifying: the listener may switch to another source
    const uint64_t generation = attempt_.generation;
    ticket_ = scheduler_.submit(source, priority_,
        [this, alive = alive_, generation](const model::LoadResult& result) {
            if (!*alive) return;
            handle_result(generation, result);
        });
    publish();
}

void RetryController::handle_result(uint64_t generation, const model::LoadResult& result) {
    if (generation != attempt_.generation) {
        util::Logger::debug("RetryController: Discarding stale result for " + result.key +
                            " (generation " + std::to_string(generation) + ", current " +
                            std::to_string(attempt_.generation) + ")");
        return;
    }
    ticket_.reset();

    if (!result.ok()) {
        handle_failure(result.error ? *result.error
                                    : model::LoadError{model::LoadErrorKind::TransientLoadFailure, "no handle"});
        return;
    }

    display_.handle = result.handle;
    display_.source = attempt_.current_source;

    if (attempt_.using_fallback) {
        // The desired resource never loaded; the fallback is only what we show
        attempt_.state = model::AttemptState::Failed;
        display_.state = model::AttemptState::Failed;
        publish();
        return;
    }

    attempt_.state = model::AttemptState::Succeeded;
    display_.state = model::AttemptState::Succeeded;
    registry_.mark(attempt_.target_key);
    if (attempt_.retries_used > 0) {
        util::Logger::info("RetryController: Loaded " + attempt_.target_key + " after " +
                           std::to_string(attempt_.retries_used) + " retries");
    }
    publish();
}

void RetryController::handle_failure(const model::LoadError& error) {
    if (attempt_.using_fallback || attempt_.current_source == policy_.fallback_url) {
        util::Logger::warn("RetryController: Fallback failed for " + attempt_.target_key + ": " + error.message);
        finish_failed();
        return;
    }

    if (!error.retryable()) {
        util::Logger::info("RetryController: " + std::string(model::to_string(error.kind)) + " for " +
                           attempt_.target_key + ", using fallback");
        switch_to_fallback();
        return;
    }

    if (attempt_.retries_used < policy_.max_retries) {
        auto delay = policy_.base_delay * (1LL << attempt_.retries_used);
        attempt_.retries_used++;
        display_.retries_used = attempt_.retries_used;

        util::Logger::info("RetryController: Load failed for " + attempt_.target_key + ", retry " +
                           std::to_string(attempt_.retries_used) + "/" + std::to_string(policy_.max_retries) +
                           " in " + std::to_string(delay.count()) + "ms");

        const uint64_t generation = attempt_.generation;
        const int retry = attempt_.retries_used;
        backoff_timer_ = loop_.schedule_after(delay, [this, alive = alive_, generation, retry] {
            if (!*alive || generation != attempt_.generation) return;
            backoff_timer_.reset();
            auto stamp = std::chrono::duration_cast<std::chrono::milliseconds>(
                loop_.clock().now().time_since_epoch());
            request(cache_busted(attempt_.target_key, retry, stamp));
        });
        publish();
        return;
    }

    util::Logger::warn("RetryController: Giving up on " + attempt_.target_key + " after " +
                       std::to_string(attempt_.retries_used) + " retries, using fallback");
    switch_to_fallback();
}

void RetryController::switch_to_fallback() {
    attempt_.using_fallback = true;
    display_.showing_fallback = true;
    display_.error = true;

    if (url::is_blank_source(policy_.fallback_url)) {
        finish_failed();
        return;
    }
    request(policy_.fallback_url);
}

void RetryController::finish_failed() {
    attempt_.state = model::AttemptState::Failed;
    display_.state = model::AttemptState::Failed;
    display_.showing_fallback = true;
    display_.error = true;
    display_.source = url::is_blank_source(policy_.fallback_url) ? std::string() : policy_.fallback_url;
    publish();
}

void RetryController::publish() {
    display_.retries_used = attempt_.retries_used;
    display_.generation = attempt_.generation;
    if (listener_) {
        listener_(display_);
    }
}

}  // namespace tessera::backend
