#include "events/EventLoop.hpp"
#include "util/Logger.hpp"
#include <vector>

namespace tessera::events {

EventLoop::EventLoop(const util::Clock& clock) : clock_(clock) {}

void EventLoop::post(Task task) {
    posted_.push_back(std::move(task));
}

EventLoop::TimerId EventLoop::schedule_after(std::chrono::milliseconds delay, Task task) {
    TimerId id = next_timer_id_++;
    auto deadline = clock_.now() + delay;
    timer_order_.emplace(deadline, id);
    timer_tasks_.emplace(id, std::make_pair(deadline, std::move(task)));
    return id;
}

bool EventLoop::cancel(TimerId id) {
    auto it = timer_tasks_.find(id);
    if (it == timer_tasks_.end()) {
        return false;
    }
    timer_order_.erase({it->second.first, id});
    timer_tasks_.erase(it);
    return true;
}

void EventLoop::schedule(const std::string& name, std::chrono::milliseconds interval, Task task) {
    util::Logger::debug("EventLoop: Scheduling periodic task " + name + " every " +
                        std::to_string(interval.count()) + "ms");

    tasks_[name] = {std::move(task), interval, clock_.now()};
}

void EventLoop::unschedule(const std::string& name) {
    util::Logger::debug("EventLoop: Unscheduling periodic task " + name);

    tasks_.erase(name);
}

size_t EventLoop::process() {
    size_t ran = 0;

    // Tasks posted while draining wait for the next call
    std::deque<Task> batch;
    batch.swap(posted_);
    for (auto& task : batch) {
        task();
        ++ran;
    }

    // Snapshot due timers first; timers created by these tasks fire later
    auto now = clock_.now();
    std::vector<TimerId> due;
    for (const auto& [deadline, id] : timer_order_) {
        if (deadline > now) break;
        due.push_back(id);
    }
    for (TimerId id : due) {
        auto it = timer_tasks_.find(id);
        if (it == timer_tasks_.end()) {
            continue;  // Cancelled by an earlier task in this batch
        }
        Task task = std::move(it->second.second);
        timer_order_.erase({it->second.first, id});
        timer_tasks_.erase(it);
        task();
        ++ran;
    }

    // Copy names first: a periodic task may unschedule itself or others
    std::vector<std::string> names;
    names.reserve(tasks_.size());
    for (const auto& [name, task] : tasks_) {
        names.push_back(name);
    }
    for (const auto& name : names) {
        auto it = tasks_.find(name);
        if (it == tasks_.end()) continue;
        if (now - it->second.last_run >= it->second.interval) {
            it->second.last_run = now;
            Task task = it->second.task;
            task();
        }
    }

    return ran;
}

std::optional<util::Clock::time_point> EventLoop::next_deadline() const {
    if (timer_order_.empty()) {
        return std::nullopt;
    }
    return timer_order_.begin()->first;
}

}  // namespace tessera::events
