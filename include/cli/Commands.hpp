#pragma once

#include "backend/Config.hpp"
#include "cli/Arguments.hpp"
#include "cli/Output.hpp"
#include <atomic>
#include <chrono>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

namespace reelcast::events { class EventBus; }

namespace reelcast::cli {

/**
 * Runs one parsed command against the core and returns the process exit
 * code. Long-running commands (stream, play) poll `shutdown` and tear
 * everything down when it is set.
 */
class CommandRunner {
public:
    CommandRunner(backend::Config config, Output& output, const std::atomic<bool>& shutdown);

    int run(const Invocation& inv);

private:
    int devices(const Invocation& inv);
    int stream(const Invocation& inv);
    int play(const Invocation& inv);
    int status(const Invocation& inv);
    int control(const Invocation& inv);
    int seek(const Invocation& inv);
    int volume(const Invocation& inv);
    bool kill_stream();

    std::optional<std::string> device_name(const Invocation& inv) const;
    std::chrono::milliseconds ready_timeout(const Invocation& inv) const;

    // Event handlers run on reader threads; they only queue text that the
    // command loop prints
    void watch_events(events::EventBus& bus);
    void flush_events();

    backend::Config config_;
    Output& output_;
    const std::atomic<bool>& shutdown_;

    std::deque<std::string> pending_messages_;
    std::mutex messages_mutex_;
};

}  // namespace reelcast::cli
