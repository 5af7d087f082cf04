#include "cast/CastController.hpp"
#include "cast/CastGrammar.hpp"
#include "events/EventBus.hpp"
#include "util/Logger.hpp"
#include "util/UnicodeUtils.hpp"
#include <cmath>
#include <format>

namespace reelcast::cast {

using model::CastState;
using model::CastStatus;
using model::CastTarget;
using util::ErrorCode;

namespace {

constexpr size_t kExcerptLength = 200;

std::string excerpt(const process::ProcessOutput& output) {
    std::string text = output.err.empty() ? output.out : output.err;
    if (text.size() > kExcerptLength) {
        text = text.substr(0, kExcerptLength) + "...";
    }
    return text.empty() ? "exit status " + std::to_string(output.exit_code) : text;
}

std::string format_seconds(double seconds) {
    // Whole seconds go out without a fraction
    if (std::floor(seconds) == seconds) {
        return std::format("{:.0f}", seconds);
    }
    return std::format("{:.1f}", seconds);
}

}  // namespace

CastController::CastController(backend::CastSettings settings, events::EventBus* bus)
    : settings_(std::move(settings)), bus_(bus) {
    if (!settings_.default_device.empty()) {
        target_ = CastTarget{settings_.default_device, {}, std::nullopt};
    }
}

util::Result<std::vector<CastTarget>> CastController::discover(
    std::optional<std::chrono::milliseconds> timeout) {
    auto budget = timeout.value_or(std::chrono::milliseconds(settings_.discovery_timeout_ms));

    std::unique_lock<std::timed_mutex> scan_lock(discovery_mutex_, std::defer_lock);
    if (!scan_lock.try_lock_for(budget)) {
        util::Logger::debug("Cast: Discovery already running, returning cached devices");
        return devices();
    }

    util::Logger::info("Cast: Scanning for devices");
    auto result = process::run_once(settings_.catt_path, {"scan"}, budget);
    if (result.is_err()) {
        util::Logger::warn("Cast: Scan failed: " + result.error().message);
        return result.error();
    }

    const auto& output = result.value();
    auto found = parse_scan_output(output.out);
    if (found.empty()) {
        found = parse_scan_output(output.err);
    }
    if (output.exit_code != 0 && found.empty()) {
        util::Logger::warn("Cast: Scan exited with status " + std::to_string(output.exit_code) +
            ": " + excerpt(output));
    }

    util::Logger::info(std::format("Cast: Found {} device(s)", found.size()));
    std::lock_guard<std::mutex> lock(mutex_);
    devices_ = found;
    return found;
}

std::vector<CastTarget> CastController::devices() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return devices_;
}

void CastController::set_target(CastTarget target) {
    util::Logger::info("Cast: Target set to " + target.name);
    std::lock_guard<std::mutex> lock(mutex_);
    if (!target_ || target_->name != target.name) {
        cached_ = CastStatus{};
    }
    target_ = std::move(target);
}

CastTarget CastController::select_target(const std::string& name) {
    CastTarget chosen{name, {}, std::nullopt};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& device : devices_) {
            if (util::names_match(device.name, name) || device.address == name) {
                chosen = device;
                break;
            }
        }
    }
    set_target(chosen);
    return chosen;
}

std::optional<CastTarget> CastController::target() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return target_;
}

util::Result<CastTarget> CastController::require_target() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!target_) {
        return util::make_error(ErrorCode::NoTarget, "no cast device selected");
    }
    return *target_;
}

util::Result<process::ProcessOutput> CastController::invoke(const CastTarget& target,
                                                            std::vector<std::string> args) {
    args.insert(args.begin(), {"-d", target.name});
    return process::run_once(settings_.catt_path, args,
                             std::chrono::milliseconds(settings_.command_timeout_ms));
}

util::Error CastController::command_failure(const std::string& verb, const CastTarget& target,
                                            const process::ProcessOutput& output) {
    std::string detail = excerpt(output);
    if (looks_unreachable(output.err + "\n" + output.out)) {
        return util::make_error(ErrorCode::DeviceUnreachable, target.name + " unreachable: " + detail);
    }
    return util::make_error(ErrorCode::CastFailed, verb + " failed on " + target.name + ": " + detail);
}

void CastController::set_cached_state(const CastState& state) {
    bool changed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        changed = !(cached_.state == state);
        cached_.state = state;
    }
    if (changed && bus_) {
        bus_->publish({events::Event::Type::CastStateChanged, {}, model::to_string(state)});
    }
}

util::EmptyResult CastController::cast(const std::string& url,
                                       const std::optional<std::string>& title,
                                       const std::optional<std::string>& subtitle) {
    auto target = require_target();
    if (target.is_err()) return target.error();

    std::vector<std::string> args = {"cast", url};
    if (subtitle) {
        args.push_back("-s");
        args.push_back(*subtitle);
    }

    util::Logger::info("Cast: Casting " + url + " to " + target.value().name);
    auto result = invoke(target.value(), args);
    if (result.is_err()) {
        util::Logger::error("Cast: cast failed: " + result.error().message);
        set_cached_state(CastState::error("cast to " + target.value().name + " failed: " +
                                          result.error().message));
        return result.error();
    }
    if (result.value().exit_code != 0) {
        auto failure = command_failure("cast", target.value(), result.value());
        util::Logger::error("Cast: " + failure.message);
        set_cached_state(CastState::error(failure.message));
        return failure;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        cached_.position_s = 0.0;
        cached_.duration_s.reset();
        cached_.title = title;
    }
    set_cached_state(CastState::of(CastState::Kind::Connecting));
    return util::success();
}

util::Result<CastStatus> CastController::status() {
    auto target = require_target();
    if (target.is_err()) return target.error();
    const auto& device = target.value();

    auto result = invoke(device, {"status"});
    if (result.is_err()) {
        if (result.code() == ErrorCode::Timeout) {
            util::Logger::warn("Cast: Status query for " + device.name + " timed out");
            return result.error();
        }
        set_cached_state(CastState::error("cannot query " + device.name + ": " + result.error().message));
        return result.error();
    }

    const auto& output = result.value();
    if (output.exit_code != 0 && looks_unreachable(output.err + "\n" + output.out)) {
        auto failure = command_failure("status", device, output);
        util::Logger::warn("Cast: " + failure.message);
        set_cached_state(CastState::error(failure.message));
        return failure;
    }

    auto update = parse_status_output(output.out);
    if (update.empty() && output.exit_code != 0) {
        util::Logger::debug("Cast: Unparseable status from " + device.name + ": " + excerpt(output));
    }

    CastStatus merged;
    bool state_changed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        merged = merge_status(cached_, update);
        state_changed = !(merged.state == cached_.state);
        cached_ = merged;
    }
    if (state_changed && bus_) {
        bus_->publish({events::Event::Type::CastStateChanged, {}, model::to_string(merged.state)});
    }
    return merged;
}

CastStatus CastController::last_status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cached_;
}

util::EmptyResult CastController::control(const std::string& verb, std::vector<std::string> args,
                                          CastState::Kind on_success) {
    auto target = require_target();
    if (target.is_err()) return target.error();

    args.insert(args.begin(), verb);
    auto result = invoke(target.value(), args);
    if (result.is_err()) {
        util::Logger::warn("Cast: " + verb + " failed: " + result.error().message);
        return result.error();
    }
    if (result.value().exit_code != 0) {
        auto failure = command_failure(verb, target.value(), result.value());
        util::Logger::warn("Cast: " + failure.message);
        return failure;
    }
    set_cached_state(CastState::of(on_success));
    return util::success();
}

util::EmptyResult CastController::play() {
    return control("play", {}, CastState::Kind::Playing);
}

util::EmptyResult CastController::pause() {
    return control("pause", {}, CastState::Kind::Paused);
}

util::EmptyResult CastController::stop() {
    return control("stop", {}, CastState::Kind::Stopped);
}

util::EmptyResult CastController::seek(double seconds) {
    auto effective = clamp_seek(seconds, last_status().duration_s);
    if (effective.is_err()) return effective.error();

    auto target = require_target();
    if (target.is_err()) return target.error();

    auto result = invoke(target.value(), {"seek", format_seconds(effective.value())});
    if (result.is_err()) return result.error();
    if (result.value().exit_code != 0) {
        return command_failure("seek", target.value(), result.value());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    cached_.position_s = effective.value();
    return util::success();
}

util::EmptyResult CastController::set_volume(double volume) {
    double clamped = clamp_volume(volume);
    auto target = require_target();
    if (target.is_err()) return target.error();

    auto level = static_cast<int>(std::lround(clamped * 100.0));
    auto result = invoke(target.value(), {"volume", std::to_string(level)});
    if (result.is_err()) return result.error();
    if (result.value().exit_code != 0) {
        return command_failure("volume", target.value(), result.value());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    cached_.volume = clamped;
    return util::success();
}

}  // namespace reelcast::cast
