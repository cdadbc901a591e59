#include "backend/LoadScheduler.hpp"
#include "util/Logger.hpp"

namespace tessera::backend {

LoadScheduler::LoadScheduler(MediaSource& source,
                             MediaCache& cache,
                             LoadedRegistry& registry,
                             events::EventLoop& loop,
                             SchedulerOptions options)
    : source_(source),
      cache_(cache),
      registry_(registry),
      loop_(loop),
      options_(options),
      alive_(std::make_shared<bool>(true)) {
    if (options_.concurrency == 0) {
        util::Logger::warn("LoadScheduler: Concurrency 0 requested, using 1");
        options_.concurrency = 1;
    }
}

LoadScheduler::~LoadScheduler() {
    *alive_ = false;
    for (auto& [ticket, flight] : in_flight_) {
        if (flight.timeout_timer != 0) {
            loop_.cancel(flight.timeout_timer);
        }
    }
}

LoadScheduler::Ticket LoadScheduler::submit(const std::string& key, int priority, Completion done) {
    Ticket ticket = next_ticket_++;

    if (auto cached = cache_.get(key)) {
        util::Logger::debug("LoadScheduler: Cache hit for " + key);
        cache_hits_.emplace(ticket, CacheHit{key, std::move(cached), std::move(done)});
        loop_.post([this, alive = alive_, ticket] {
            if (!*alive) return;
            answer_from_cache(ticket);
        });
        return ticket;
    }

    pending_.emplace(std::make_pair(priority, ticket),
                     QueueItem{ticket, key, priority, loop_.clock().now(), std::move(done)});
    pending_priority_[ticket] = priority;

    util::Logger::debug("LoadScheduler: Queued " + key + " (priority=" + std::to_string(priority) +
                        ", pending=" + std::to_string(pending_.size()) + ")");

    request_dispatch();
    return ticket;
}

void LoadScheduler::answer_from_cache(Ticket ticket) {
    auto it = cache_hits_.find(ticket);
    if (it == cache_hits_.end()) {
        return;  // Cancelled
    }
    CacheHit hit = std::move(it->second);
    cache_hits_.erase(it);

    model::LoadResult result;
    result.key = hit.key;
    result.handle = std::move(hit.handle);
    if (hit.done) {
        hit.done(result);
    }
}

bool LoadScheduler::cancel(Ticket ticket) {
    if (cache_hits_.erase(ticket) > 0) {
        return true;
    }
    auto it = pending_priority_.find(ticket);
    if (it == pending_priority_.end()) {
        return false;
    }
    pending_.erase({it->second, ticket});
    pending_priority_.erase(it);
    return true;
}

size_t LoadScheduler::clear_pending() {
    size_t dropped = pending_.size() + cache_hits_.size();
    pending_.clear();
    pending_priority_.clear();
    cache_hits_.clear();
    if (dropped > 0) {
        util::Logger::debug("LoadScheduler: Dropped " + std::to_string(dropped) + " pending requests");
    }
    return dropped;
}

void LoadScheduler::request_dispatch() {
    if (dispatch_posted_) {
        return;
    }
    dispatch_posted_ = true;
    loop_.post([this, alive = alive_] {
        if (!*alive) return;
        dispatch_posted_ = false;
        dispatch();
    });
}

void LoadScheduler::dispatch() {
    // A source may settle synchronously from inside fetch(); fold the nested
    // dispatch into the outer loop instead of recursing.
    if (dispatching_) {
        redispatch_ = true;
        return;
    }

    dispatching_ = true;
    do {
        redispatch_ = false;
        while (in_flight_.size() < options_.concurrency && !pending_.empty()) {
            auto node = pending_.extract(pending_.begin());
            pending_priority_.erase(node.mapped().ticket);
            start(std::move(node.mapped()));
        }
    } while (redispatch_);
    dispatching_ = false;
}

void LoadScheduler::start(QueueItem item) {
    const Ticket ticket = item.ticket;
    const std::string key = item.key;

    InFlight& flight = in_flight_[ticket];
    flight.key = key;
    flight.done = std::move(item.done);

    if (options_.fetch_timeout.count() > 0) {
        flight.timeout_timer = loop_.schedule_after(options_.fetch_timeout, [this, alive = alive_, ticket] {
            if (!*alive) return;
            auto it = in_flight_.find(ticket);
            if (it == in_flight_.end()) return;
            it->second.timeout_timer = 0;
            util::Logger::warn("LoadScheduler: Fetch timed out for " + it->second.key);
            settle(ticket, nullptr, model::LoadError{model::LoadErrorKind::Timeout, "fetch timed out"});
        });
    }

    util::Logger::debug("LoadScheduler: Dispatching " + key + " (in_flight=" +
                        std::to_string(in_flight_.size()) + "/" + std::to_string(options_.concurrency) + ")");

    source_.fetch(
        key,
        [this, alive = alive_, ticket](model::MediaHandlePtr handle) {
            if (!*alive) return;
            settle(ticket, std::move(handle), std::nullopt);
        },
        [this, alive = alive_, ticket](const model::LoadError& error) {
            if (!*alive) return;
            settle(ticket, nullptr, error);
        });
}

void LoadScheduler::settle(Ticket ticket, model::MediaHandlePtr handle, std::optional<model::LoadError> error) {
    auto it = in_flight_.find(ticket);
    if (it == in_flight_.end()) {
        // Already settled by the timeout
        util::Logger::debug("LoadScheduler: Discarding late result for ticket " + std::to_string(ticket));
        return;
    }

    InFlight flight = std::move(it->second);
    in_flight_.erase(it);
    if (flight.timeout_timer != 0) {
        loop_.cancel(flight.timeout_timer);
    }

    if (!error && !handle) {
        error = model::LoadError{model::LoadErrorKind::TransientLoadFailure, "source returned no handle"};
    }

    model::LoadResult result;
    result.key = flight.key;
    if (error) {
        util::Logger::debug("LoadScheduler: Failed " + flight.key + " (" + model::to_string(error->kind) +
                            ": " + error->message + ")");
        result.error = std::move(error);
    } else {
        cache_.set(flight.key, handle);
        registry_.mark(flight.key);
        result.handle = std::move(handle);
    }

    if (flight.done) {
        flight.done(result);
    }

    dispatch();
}

}  // namespace tessera::backend
