#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <string>

namespace reelcast::events {

// Named periodic tasks driven from the caller's loop (no thread of its own)
class Scheduler {
public:
    using Task = std::function<void()>;

    // Replaces a task with the same name. `run_immediately` makes the first
    // process() call run it instead of waiting one interval.
    void schedule(const std::string& name, std::chrono::milliseconds interval, Task task,
                  bool run_immediately = false);
    void unschedule(const std::string& name);
    bool is_scheduled(const std::string& name) const;

    // Returns the number of tasks that ran
    int process();

private:
    struct ScheduledTask {
        Task task;
        std::chrono::milliseconds interval;
        std::chrono::steady_clock::time_point last_run;
    };

    std::map<std::string, ScheduledTask> tasks_;
};

}  // namespace reelcast::events
