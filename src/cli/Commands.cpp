#include "cli/Commands.hpp"
#include "cast/CastController.hpp"
#include "events/EventBus.hpp"
#include "events/Scheduler.hpp"
#include "net/AddressResolver.hpp"
#include "process/ProcessLauncher.hpp"
#include "playback/PlaybackOrchestrator.hpp"
#include "subtitles/SubtitleStager.hpp"
#include "transfer/TransferManager.hpp"
#include "ui/Formatting.hpp"
#include "ui/StatusLine.hpp"
#include "util/Logger.hpp"
#include <cmath>
#include <future>
#include <thread>

namespace reelcast::cli {

using namespace std::chrono_literals;
using util::ErrorCode;

namespace {

constexpr auto kLoopTick = 33ms;
constexpr auto kProgressInterval = 500ms;

std::optional<std::string> nonempty(const std::string& value) {
    if (value.empty()) return std::nullopt;
    return value;
}

}  // namespace

CommandRunner::CommandRunner(backend::Config config, Output& output, const std::atomic<bool>& shutdown)
    : config_(std::move(config)), output_(output), shutdown_(shutdown) {}

int CommandRunner::run(const Invocation& inv) {
    util::Logger::info("CLI: Running '" + inv.command + "'");

    if (inv.command == "help") {
        output_.data(Json::Value(usage()), usage());
        return static_cast<int>(ExitCode::Success);
    }
    if (inv.command == "devices") return devices(inv);
    if (inv.command == "stream") return stream(inv);
    if (inv.command == "play") return play(inv);
    if (inv.command == "status") return status(inv);
    if (inv.command == "seek") return seek(inv);
    if (inv.command == "volume") return volume(inv);
    if (inv.command == "resume" || inv.command == "pause" || inv.command == "stop") {
        return control(inv);
    }
    return output_.error(util::make_error(ErrorCode::InvalidArgument, "unknown command " + inv.command));
}

std::optional<std::string> CommandRunner::device_name(const Invocation& inv) const {
    if (inv.device) return inv.device;
    return nonempty(config_.cast.default_device);
}

std::chrono::milliseconds CommandRunner::ready_timeout(const Invocation& inv) const {
    if (inv.timeout_s) return std::chrono::seconds(*inv.timeout_s);
    return std::chrono::milliseconds(config_.transfer.ready_timeout_ms);
}

void CommandRunner::watch_events(events::EventBus& bus) {
    auto queue = [this](std::string message) {
        std::lock_guard<std::mutex> lock(messages_mutex_);
        pending_messages_.push_back(std::move(message));
    };
    bus.subscribe(events::Event::Type::TransferStateChanged, [queue](const events::Event& e) {
        queue("Transfer " + e.session_id + ": " + e.data);
    });
    bus.subscribe(events::Event::Type::TransferUrlResolved, [queue](const events::Event& e) {
        queue("Stream URL: " + e.data);
    });
    bus.subscribe(events::Event::Type::CastStateChanged, [queue](const events::Event& e) {
        queue("Device: " + e.data);
    });
    bus.subscribe(events::Event::Type::PlaybackWarning, [queue](const events::Event& e) {
        queue("Warning: " + e.data);
    });
}

void CommandRunner::flush_events() {
    std::deque<std::string> messages;
    {
        std::lock_guard<std::mutex> lock(messages_mutex_);
        messages.swap(pending_messages_);
    }
    for (const auto& message : messages) {
        output_.info(message);
    }
}

int CommandRunner::devices(const Invocation& inv) {
    cast::CastController controller(config_.cast);
    std::optional<std::chrono::milliseconds> timeout;
    if (inv.timeout_s) timeout = std::chrono::seconds(*inv.timeout_s);

    output_.info("Scanning for devices...");
    auto found = controller.discover(timeout);
    if (found.is_err()) {
        return output_.error(found.error());
    }

    std::string human;
    for (const auto& device : found.value()) {
        if (!human.empty()) human += '\n';
        human += device.name;
        if (device.model) human += " (" + *device.model + ")";
        if (!device.address.empty()) human += " - " + device.address;
    }
    if (human.empty()) human = "No devices found";

    output_.data(to_json(found.value()), human);
    return static_cast<int>(ExitCode::Success);
}

int CommandRunner::stream(const Invocation& inv) {
    events::EventBus bus;
    watch_events(bus);
    net::AddressResolver resolver(nonempty(config_.transfer.lan_address));
    transfer::TransferManager manager(config_.transfer, resolver, &bus);

    auto started = manager.start(*inv.magnet, {inv.file_index, std::nullopt});
    if (started.is_err()) {
        return output_.error(started.error());
    }
    const auto id = started.value();

    auto deadline = std::chrono::steady_clock::now() + ready_timeout(inv);
    bool announced = false;
    int exit_code = static_cast<int>(ExitCode::Success);
    int width = ui::terminal_width();

    events::Scheduler scheduler;
    scheduler.schedule("progress", kProgressInterval, [&]() {
        if (auto session = manager.status(id)) {
            output_.status_line(ui::transfer_line(*session, width));
        }
    });

    while (!shutdown_.load()) {
        flush_events();
        auto session = manager.status(id);
        if (!session) break;

        if (session->state.kind == model::TransferState::Kind::Error) {
            auto code = session->state.no_peers ? ErrorCode::NoPeers : ErrorCode::TransferFailed;
            exit_code = output_.error(util::make_error(code, session->state.reason));
            break;
        }
        if (session->state.kind == model::TransferState::Kind::Stopped) {
            output_.info("Transfer finished");
            break;
        }
        if (!announced && session->state.has_stream() && session->stream_url) {
            Json::Value data;
            data["session"] = id;
            data["url"] = *session->stream_url;
            output_.data(data, "Streaming at " + *session->stream_url + " (Ctrl+C to stop)");
            announced = true;
        }
        if (!announced && std::chrono::steady_clock::now() >= deadline) {
            exit_code = output_.error(util::make_error(ErrorCode::Timeout,
                "stream not ready (" + model::to_string(session->state) + ")"));
            break;
        }

        scheduler.process();
        std::this_thread::sleep_for(kLoopTick);
    }

    output_.end_status_line();
    manager.stop_all();
    return exit_code;
}

int CommandRunner::play(const Invocation& inv) {
    auto name = device_name(inv);
    if (!name) {
        return output_.error(util::make_error(ErrorCode::NoTarget,
            "no cast device selected; pass -d NAME or set cast.default_device"));
    }

    events::EventBus bus;
    watch_events(bus);
    net::AddressResolver resolver(nonempty(config_.transfer.lan_address));
    transfer::TransferManager manager(config_.transfer, resolver, &bus);
    cast::CastController controller(config_.cast, &bus);
    subtitles::SubtitleStager stager(config_.subtitles.cache_dir);
    playback::PlaybackOrchestrator orchestrator(manager, controller, &stager,
                                                config_.playback.on_transfer_loss, &bus);

    auto target = controller.select_target(*name);

    playback::PlayOptions options;
    options.file_index = inv.file_index;
    options.title = inv.title;
    options.subtitle = inv.subtitle;
    options.ready_timeout = ready_timeout(inv);
    options.should_cancel = [this]() { return shutdown_.load(); };

    output_.info("Starting stream for " + target.name + "...");
    auto pending = std::async(std::launch::async, [&]() {
        return orchestrator.play(*inv.magnet, target, options);
    });

    int width = ui::terminal_width();
    events::Scheduler scheduler;
    scheduler.schedule("prepare", kProgressInterval, [&]() {
        for (const auto& session : manager.list()) {
            output_.status_line(ui::transfer_line(session, width));
        }
    });
    while (pending.wait_for(kLoopTick) != std::future_status::ready) {
        flush_events();
        scheduler.process();
    }
    scheduler.unschedule("prepare");
    flush_events();

    auto started = pending.get();
    if (started.is_err()) {
        int code = output_.error(started.error());
        orchestrator.shutdown();
        return code;
    }
    output_.data(to_json(started.value()), "Casting to " + target.name);

    // Watch until playback ends or we are interrupted
    int exit_code = static_cast<int>(ExitCode::Success);
    bool seen_playing = false;
    bool finished = false;
    std::optional<model::UnifiedState> last_state;
    scheduler.schedule("status", std::chrono::milliseconds(config_.playback.poll_interval_ms), [&]() {
        auto current = orchestrator.status();
        if (output_.json()) {
            if (last_state != current.state) output_.data(to_json(current), {});
        } else {
            output_.status_line(ui::playback_line(current, width));
        }
        last_state = current.state;

        using model::UnifiedState;
        if (current.state == UnifiedState::Playing || current.state == UnifiedState::Paused) {
            seen_playing = true;
        }
        bool device_idle = current.cast && (current.cast->state.kind == model::CastState::Kind::Idle ||
                                            current.cast->state.kind == model::CastState::Kind::Stopped);
        if (current.state == UnifiedState::Error) {
            exit_code = output_.error(util::make_error(
                current.error_code.value_or(ErrorCode::TransferFailed), current.detail));
            finished = true;
        } else if (current.state == UnifiedState::Stopped || current.state == UnifiedState::Idle ||
                   (seen_playing && device_idle)) {
            output_.info("Playback finished");
            finished = true;
        }
    }, true);

    while (!shutdown_.load() && !finished) {
        flush_events();
        scheduler.process();
        std::this_thread::sleep_for(kLoopTick);
    }

    if (shutdown_.load()) {
        output_.info("Stopping...");
    }
    output_.end_status_line();
    orchestrator.shutdown();
    flush_events();
    return exit_code;
}

int CommandRunner::status(const Invocation& inv) {
    auto name = device_name(inv);
    if (!name) {
        return output_.error(util::make_error(ErrorCode::NoTarget, "no cast device selected; pass -d NAME"));
    }
    cast::CastController controller(config_.cast);
    controller.set_target(model::CastTarget{*name, {}, std::nullopt});

    auto current = controller.status();
    if (current.is_err()) {
        return output_.error(current.error());
    }
    output_.data(to_json(current.value()), ui::cast_status_text(current.value()));
    if (!inv.watch) {
        return static_cast<int>(ExitCode::Success);
    }

    int exit_code = static_cast<int>(ExitCode::Success);
    bool device_lost = false;
    model::CastStatus last = current.value();
    events::Scheduler scheduler;
    scheduler.schedule("status", std::chrono::seconds(inv.interval_s), [&]() {
        auto polled = controller.status();
        if (polled.is_err()) {
            if (polled.code() == ErrorCode::Timeout) return;
            exit_code = output_.error(polled.error());
            device_lost = true;
            return;
        }
        if (!(last == polled.value())) {
            output_.data(to_json(polled.value()), ui::cast_status_text(polled.value()));
            last = polled.value();
        }
    });

    while (!shutdown_.load() && !device_lost) {
        scheduler.process();
        std::this_thread::sleep_for(kLoopTick);
    }
    return exit_code;
}

int CommandRunner::control(const Invocation& inv) {
    auto name = device_name(inv);
    if (!name) {
        return output_.error(util::make_error(ErrorCode::NoTarget, "no cast device selected; pass -d NAME"));
    }
    cast::CastController controller(config_.cast);
    controller.set_target(model::CastTarget{*name, {}, std::nullopt});

    util::EmptyResult result = util::success();
    if (inv.command == "resume") result = controller.play();
    else if (inv.command == "pause") result = controller.pause();
    else result = controller.stop();

    if (result.is_err()) {
        return output_.error(result.error());
    }
    Json::Value data;
    data["status"] = "ok";
    data["action"] = inv.command;
    if (inv.command == "stop" && inv.kill_stream) {
        data["stream_killed"] = kill_stream();
    }
    output_.data(data, "OK");
    return static_cast<int>(ExitCode::Success);
}

// The transfer belongs to another reelcast process, so it is found by the
// client's command line
bool CommandRunner::kill_stream() {
    auto killed = process::run_once("pkill", {"-f", config_.transfer.webtorrent_path},
                                    std::chrono::milliseconds(config_.cast.command_timeout_ms));
    if (killed.is_err()) {
        util::Logger::warn("CLI: Cannot end the transfer: " + killed.error().message);
        output_.info("Could not stop the torrent stream: " + killed.error().message);
        return false;
    }
    if (killed.value().exit_code != 0) {
        output_.info("No torrent stream was running");
        return false;
    }
    output_.info("Stopped torrent stream");
    return true;
}

int CommandRunner::seek(const Invocation& inv) {
    auto name = device_name(inv);
    if (!name) {
        return output_.error(util::make_error(ErrorCode::NoTarget, "no cast device selected; pass -d NAME"));
    }
    cast::CastController controller(config_.cast);
    controller.set_target(model::CastTarget{*name, {}, std::nullopt});

    // The current position anchors relative seeks; the duration clamps the rest
    auto known = controller.status();
    if (known.is_err()) {
        if (inv.seek->relative) {
            return output_.error(known.error());
        }
        util::Logger::debug("CLI: Seeking without a known duration: " + known.error().message);
    }

    double position = resolve_seek(*inv.seek, controller.last_status().position_s);
    auto result = controller.seek(position);
    if (result.is_err()) {
        return output_.error(result.error());
    }
    Json::Value data;
    data["status"] = "ok";
    data["position"] = controller.last_status().position_s;
    output_.data(data, "Position: " + ui::format_clock(controller.last_status().position_s));
    return static_cast<int>(ExitCode::Success);
}

int CommandRunner::volume(const Invocation& inv) {
    auto name = device_name(inv);
    if (!name) {
        return output_.error(util::make_error(ErrorCode::NoTarget, "no cast device selected; pass -d NAME"));
    }
    cast::CastController controller(config_.cast);
    controller.set_target(model::CastTarget{*name, {}, std::nullopt});

    if (inv.volume->relative) {
        auto known = controller.status();
        if (known.is_err()) {
            return output_.error(known.error());
        }
    }

    auto result = controller.set_volume(resolve_volume(*inv.volume, controller.last_status().volume));
    if (result.is_err()) {
        return output_.error(result.error());
    }
    int level = static_cast<int>(std::lround(controller.last_status().volume * 100.0));
    Json::Value data;
    data["status"] = "ok";
    data["volume"] = level;
    output_.data(data, "Volume: " + std::to_string(level) + "%");
    return static_cast<int>(ExitCode::Success);
}

}  // namespace reelcast::cli
