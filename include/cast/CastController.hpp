#pragma once

#include "backend/Config.hpp"
#include "model/Session.hpp"
#include "process/ProcessLauncher.hpp"
#include "util/Result.hpp"
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace reelcast::events { class EventBus; }

namespace reelcast::cast {

/**
 * Drives the display device through one-shot invocations of the cast
 * control tool. Holds the single active target, the last discovered device
 * list and the last status we managed to parse.
 *
 * Thread-safe; the lock is never held while the tool runs. Discovery is
 * serialized separately so a slow scan does not block status queries.
 */
class CastController {
public:
    explicit CastController(backend::CastSettings settings, events::EventBus* bus = nullptr);

    util::Result<std::vector<model::CastTarget>> discover(
        std::optional<std::chrono::milliseconds> timeout = std::nullopt);
    std::vector<model::CastTarget> devices() const;

    void set_target(model::CastTarget target);
    // Match `name` against the discovered devices; unknown names become a
    // name-only target and the tool resolves them itself
    model::CastTarget select_target(const std::string& name);
    std::optional<model::CastTarget> target() const;

    util::EmptyResult cast(const std::string& url,
                           const std::optional<std::string>& title = std::nullopt,
                           const std::optional<std::string>& subtitle = std::nullopt);

    util::Result<model::CastStatus> status();
    model::CastStatus last_status() const;

    util::EmptyResult play();
    util::EmptyResult pause();
    util::EmptyResult stop();
    util::EmptyResult seek(double seconds);
    util::EmptyResult set_volume(double volume);

private:
    util::Result<model::CastTarget> require_target() const;
    util::Result<process::ProcessOutput> invoke(const model::CastTarget& target,
                                                std::vector<std::string> args);
    util::EmptyResult control(const std::string& verb, std::vector<std::string> args,
                              model::CastState::Kind on_success);
    util::Error command_failure(const std::string& verb, const model::CastTarget& target,
                                const process::ProcessOutput& output);
    void set_cached_state(const model::CastState& state);

    backend::CastSettings settings_;
    events::EventBus* bus_;

    std::optional<model::CastTarget> target_;
    std::vector<model::CastTarget> devices_;
    model::CastStatus cached_;
    mutable std::mutex mutex_;
    std::timed_mutex discovery_mutex_;
};

}  // namespace reelcast::cast
