#pragma once

#include "backend/LoadedRegistry.hpp"
#include "backend/MediaCache.hpp"
#include "backend/MediaSource.hpp"
#include "events/EventLoop.hpp"
#include "model/MediaHandle.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

namespace tessera::backend {

struct SchedulerOptions {
    size_t concurrency = 6;
    std::chrono::milliseconds fetch_timeout{0};  // 0 = no timeout
};

/**
 * Bounded-concurrency dispatcher for media loads.
 *
 * Pending requests are ordered by ascending priority (lower = more urgent),
 * ties broken by submission order. At most `concurrency` requests are in
 * flight; whenever one settles the next pending request is dispatched
 * immediately. Dispatch of fresh submissions happens on the next event-loop
 * turn, so a burst submitted in one turn is ordered before anything starts.
 *
 * A key already live in the cache is answered from it on the next loop turn
 * without taking a slot or touching the source.
 *
 * Successes populate the cache and the registry before the completion runs.
 * Failures are reported as-is: retry policy lives in RetryController.
 */
class LoadScheduler {
public:
    using Ticket = uint64_t;
    using Completion = std::function<void(const model::LoadResult&)>;

    LoadScheduler(MediaSource& source,
                  MediaCache& cache,
                  LoadedRegistry& registry,
                  events::EventLoop& loop,
                  SchedulerOptions options = {});
    ~LoadScheduler();

    LoadScheduler(const LoadScheduler&) = delete;
    LoadScheduler& operator=(const LoadScheduler&) = delete;

    Ticket submit(const std::string& key, int priority, Completion done);

    // Removes a request that has not been dispatched (or answered from the
    // cache) yet. Its completion is never called. In-flight requests cannot
    // be aborted.
    bool cancel(Ticket ticket);

    // Drops every undispatched request and unanswered cache hit; returns how many were dropped
    size_t clear_pending();

    size_t in_flight() const { return in_flight_.size(); }
    size_t pending() const { return pending_.size(); }
    size_t concurrency() const { return options_.concurrency; }

private:
    struct QueueItem {
        Ticket ticket;
        std::string key;
        int priority;
        util::Clock::time_point enqueued_at;
        Completion done;
    };

    struct CacheHit {
        std::string key;
        model::MediaHandlePtr handle;
        Completion done;
    };

    struct InFlight {
        std::string key;
        Completion done;
        events::EventLoop::TimerId timeout_timer = 0;
    };

    void answer_from_cache(Ticket ticket);
    void request_dispatch();
    void dispatch();
    void start(QueueItem item);
    void settle(Ticket ticket, model::MediaHandlePtr handle, std::optional<model::LoadError> error);

    MediaSource& source_;
    MediaCache& cache_;
    LoadedRegistry& registry_;
    events::EventLoop& loop_;
    SchedulerOptions options_;

    // (priority, ticket) -> item; tickets increase monotonically so ties keep FIFO order
    std::map<std::pair<int, Ticket>, QueueItem> pending_;
    std::unordered_map<Ticket, int> pending_priority_;
    std::unordered_map<Ticket, InFlight> in_flight_;
    std::unordered_map<Ticket, CacheHit> cache_hits_;
    Ticket next_ticket_ = 1;

    bool dispatch_posted_ = false;
    bool dispatching_ = false;
    bool redispatch_ = false;

    // Completions posted to the loop check this before touching the scheduler
    std::shared_ptr<bool> alive_;
};

}  // namespace tessera::backend
