#pragma once

#include "util/Clock.hpp"
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>

namespace tessera::events {

// Single-threaded cooperative loop. Nothing here runs in parallel: every
// task executes inside process(), one after the other, so structures shared
// between tasks need no locking as long as each task leaves them consistent.
class EventLoop {
public:
    using Task = std::function<void()>;
    using TimerId = uint64_t;

    explicit EventLoop(const util::Clock& clock);

    // Run on the next process() call
    void post(Task task);

    // One-shot timer; returns an id usable with cancel()
    TimerId schedule_after(std::chrono::milliseconds delay, Task task);
    bool cancel(TimerId id);

    // Named periodic task; interval 0 runs it on every process() call
    void schedule(const std::string& name, std::chrono::milliseconds interval, Task task);
    void unschedule(const std::string& name);

    // Runs posted tasks, due timers and due periodic tasks.
    // Returns how many posted and timer tasks ran (periodic tasks are not counted).
    size_t process();

    std::optional<util::Clock::time_point> next_deadline() const;
    size_t pending_timers() const { return timer_tasks_.size(); }
    bool has_posted() const { return !posted_.empty(); }

    const util::Clock& clock() const { return clock_; }

private:
    struct ScheduledTask {
        Task task;
        std::chrono::milliseconds interval;
        util::Clock::time_point last_run;
    };

    const util::Clock& clock_;
    std::deque<Task> posted_;

    // Ordered by (deadline, id) so equal deadlines fire in creation order
    std::set<std::pair<util::Clock::time_point, TimerId>> timer_order_;
    std::unordered_map<TimerId, std::pair<util::Clock::time_point, Task>> timer_tasks_;
    TimerId next_timer_id_ = 1;

    std::map<std::string, ScheduledTask> tasks_;
};

}  // namespace tessera::events
