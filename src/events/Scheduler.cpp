#include "events/Scheduler.hpp"
#include "util/Logger.hpp"
#include <format>
#include <vector>

namespace reelcast::events {

void Scheduler::schedule(const std::string& name, std::chrono::milliseconds interval, Task task,
                         bool run_immediately) {
    util::Logger::debug(std::format("Scheduler: Scheduling '{}' every {} ms", name, interval.count()));

    auto now = std::chrono::steady_clock::now();
    tasks_[name] = {std::move(task), interval, run_immediately ? now - interval : now};
}

void Scheduler::unschedule(const std::string& name) {
    util::Logger::debug(std::format("Scheduler: Unscheduling '{}'", name));

    tasks_.erase(name);
}

bool Scheduler::is_scheduled(const std::string& name) const {
    return tasks_.count(name) > 0;
}

int Scheduler::process() {
    auto now = std::chrono::steady_clock::now();

    // Collect first: a task may unschedule itself or others
    std::vector<std::string> due;
    for (const auto& [name, task] : tasks_) {
        if (now - task.last_run >= task.interval) {
            due.push_back(name);
        }
    }

    int ran = 0;
    for (const auto& name : due) {
        auto it = tasks_.find(name);
        if (it == tasks_.end()) continue;
        it->second.last_run = now;
        Task task = it->second.task;
        task();
        ran++;
    }
    return ran;
}

}  // namespace reelcast::events
