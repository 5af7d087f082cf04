#include "playback/PlaybackOrchestrator.hpp"
#include "cast/CastController.hpp"
#include "events/EventBus.hpp"
#include "subtitles/SubtitleStager.hpp"
#include "transfer/TransferManager.hpp"
#include "util/Logger.hpp"
#include <thread>

namespace reelcast::playback {

using namespace std::chrono_literals;
using model::TransferState;
using util::ErrorCode;

namespace {

constexpr auto kReadyPollInterval = 200ms;

bool is_url(const std::string& text) {
    return text.starts_with("http://") || text.starts_with("https://");
}

}  // namespace

PlaybackOrchestrator::PlaybackOrchestrator(transfer::TransferManager& transfers,
                                           cast::CastController& cast,
                                           const subtitles::SubtitleStager* stager,
                                           model::TransferLossPolicy policy,
                                           events::EventBus* bus)
    : transfers_(transfers), cast_(cast), stager_(stager), policy_(policy), bus_(bus) {}

PlaybackOrchestrator::~PlaybackOrchestrator() {
    shutdown();
}

std::optional<model::SessionId> PlaybackOrchestrator::active_session() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!active_) return std::nullopt;
    return active_->transfer_id;
}

util::Result<PlaybackStatus> PlaybackOrchestrator::play(const std::string& locator,
                                                        const model::CastTarget& target,
                                                        const PlayOptions& options) {
    std::optional<model::SessionId> reuse;
    bool replace = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (active_) {
            if (active_->locator != locator) {
                replace = true;
            } else {
                reuse = active_->transfer_id;
            }
        }
    }
    if (replace) {
        util::Logger::info("Playback: Replacing the active session");
        auto stopped = stop();
        if (stopped.is_err()) return stopped.error();
    }
    if (reuse) {
        auto current = transfers_.status(*reuse);
        if (!current || current->state.is_terminal()) {
            util::Logger::info("Playback: Previous transfer for this locator ended, starting a new one");
            auto stopped = stop();
            if (stopped.is_err()) return stopped.error();
            reuse.reset();
        }
    }

    auto subtitle = resolve_subtitle(options);
    if (subtitle.is_err()) return subtitle.error();

    model::SessionId id;
    if (reuse) {
        id = *reuse;
        util::Logger::info("Playback: Reusing transfer " + id);
    } else {
        auto started = transfers_.start(locator, {options.file_index, options.expected_size_bytes});
        if (started.is_err()) return started.error();
        id = started.value();
    }

    ActiveSession session{id, target, locator, options, subtitle.value()};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        active_ = session;
    }

    auto url = wait_for_stream(id, options);
    if (url.is_err()) return url.error();

    util::Logger::info("Playback: Stream ready at " + url.value());
    if (auto casted = cast_active(session, url.value()); casted.is_err()) {
        return casted.error();
    }
    return status();
}

util::Result<std::string> PlaybackOrchestrator::wait_for_stream(const model::SessionId& id,
                                                                const PlayOptions& options) {
    auto deadline = std::chrono::steady_clock::now() + options.ready_timeout;
    while (true) {
        auto session = transfers_.status(id);
        if (!session) {
            return util::make_error(ErrorCode::SessionNotFound, "transfer " + id + " disappeared");
        }
        if (session->state.has_stream() && session->stream_url) {
            return *session->stream_url;
        }
        if (session->state.kind == TransferState::Kind::Error) {
            return util::make_error(session->state.no_peers ? ErrorCode::NoPeers : ErrorCode::TransferFailed,
                                    session->state.reason);
        }
        if (session->state.kind == TransferState::Kind::Stopped) {
            return util::make_error(ErrorCode::TransferFailed, "transfer stopped before streaming");
        }
        if (options.should_cancel && options.should_cancel()) {
            return util::make_error(ErrorCode::InvalidState, "playback start cancelled");
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            util::Logger::warn("Playback: Stream not ready after " +
                std::to_string(options.ready_timeout.count()) + " ms, transfer keeps running");
            return util::make_error(ErrorCode::Timeout,
                "stream not ready within " + std::to_string(options.ready_timeout.count()) + " ms (" +
                model::to_string(session->state) + ")");
        }
        std::this_thread::sleep_for(kReadyPollInterval);
    }
}

util::Result<std::optional<std::string>> PlaybackOrchestrator::resolve_subtitle(
    const PlayOptions& options) const {
    if (!options.subtitle || options.subtitle->empty()) {
        return std::optional<std::string>{};
    }
    const std::string& subtitle = *options.subtitle;
    if (is_url(subtitle) || !stager_) {
        return std::optional<std::string>{subtitle};
    }
    auto staged = stager_->stage(subtitle);
    if (staged.is_err()) {
        util::Logger::warn("Playback: Subtitle rejected: " + staged.error().message);
        return staged.error();
    }
    return std::optional<std::string>{staged.value().string()};
}

util::EmptyResult PlaybackOrchestrator::cast_active(const ActiveSession& session, const std::string& url) {
    cast_.set_target(session.target);
    auto casted = cast_.cast(url, session.options.title, session.subtitle);
    std::lock_guard<std::mutex> lock(mutex_);
    bool current = active_ && active_->transfer_id == session.transfer_id;
    if (casted.is_err()) {
        util::Logger::warn("Playback: Cast failed, transfer stays up for resume_cast: " +
            casted.error().message);
        if (current) active_->cast_error = casted.code();
        return casted;
    }
    if (current) {
        active_->cast_issued = true;
        active_->cast_error.reset();
        active_->stopped_for_loss = false;
    }
    return util::success();
}

util::EmptyResult PlaybackOrchestrator::resume_cast() {
    std::optional<ActiveSession> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        session = active_;
    }
    if (!session) {
        return util::make_error(ErrorCode::NoActiveSession, "nothing is playing");
    }

    auto transfer = transfers_.status(session->transfer_id);
    if (!transfer || !transfer->state.has_stream() || !transfer->stream_url) {
        return util::make_error(ErrorCode::InvalidState, "the transfer is not streaming yet (" +
            (transfer ? model::to_string(transfer->state) : std::string("gone")) + ")");
    }
    util::Logger::info("Playback: Re-casting " + *transfer->stream_url);
    return cast_active(*session, *transfer->stream_url);
}

PlaybackStatus PlaybackOrchestrator::status() {
    std::optional<ActiveSession> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        session = active_;
    }

    PlaybackStatus result;
    if (!session) {
        auto merged = merge(std::nullopt, std::nullopt, policy_);
        result.state = merged.state;
        result.detail = merged.detail;
        return result;
    }

    result.target = session->target;
    result.transfer = transfers_.status(session->transfer_id);

    std::optional<model::TransferState> transfer_state;
    if (result.transfer) transfer_state = result.transfer->state;

    if (session->cast_error) {
        // Not re-queried: the device was never handed the stream
        result.cast = cast_.last_status();
    } else if (transfer_state && transfer_state->has_stream() && session->cast_issued) {
        auto queried = cast_.status();
        result.cast = queried.is_ok() ? queried.value() : cast_.last_status();
    } else if (transfer_state && transfer_state->kind == TransferState::Kind::Error && session->cast_issued) {
        result.cast = cast_.last_status();
    }

    auto merged = merge(transfer_state, result.cast, policy_);
    result.state = merged.state;
    result.detail = merged.detail;
    result.warning = merged.warning;
    if (result.state == model::UnifiedState::Error) {
        if (transfer_state && transfer_state->kind == TransferState::Kind::Error) {
            result.error_code = transfer_state->no_peers ? ErrorCode::NoPeers : ErrorCode::TransferFailed;
        } else {
            result.error_code = session->cast_error.value_or(ErrorCode::DeviceUnreachable);
        }
    } else if (transfer_state && transfer_state->has_stream() && !session->cast_issued) {
        result.detail = "stream ready, nothing cast yet";
    }

    if (merged.stop_cast && !session->stopped_for_loss) {
        util::Logger::warn("Playback: Transfer lost, stopping the device");
        auto stopped = cast_.stop();
        if (stopped.is_err()) {
            util::Logger::warn("Playback: Could not stop the device: " + stopped.error().message);
        }
        std::lock_guard<std::mutex> lock(mutex_);
        if (active_ && active_->transfer_id == session->transfer_id) {
            active_->stopped_for_loss = true;
        }
    }

    publish_state(result);
    return result;
}

void PlaybackOrchestrator::publish_state(const PlaybackStatus& status) {
    if (!bus_) return;
    bool changed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        changed = last_published_ != status.state;
        last_published_ = status.state;
    }
    if (changed) {
        std::string id = status.transfer ? status.transfer->id : std::string();
        bus_->publish({events::Event::Type::PlaybackStateChanged, id, model::to_string(status.state)});
        if (status.warning) {
            bus_->publish({events::Event::Type::PlaybackWarning, id, *status.warning});
        }
    }
}

util::EmptyResult PlaybackOrchestrator::require_active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!active_) {
        return util::make_error(ErrorCode::NoActiveSession, "nothing is playing");
    }
    return util::success();
}

util::EmptyResult PlaybackOrchestrator::pause() {
    if (auto active = require_active(); active.is_err()) return active;
    return cast_.pause();
}

util::EmptyResult PlaybackOrchestrator::resume() {
    if (auto active = require_active(); active.is_err()) return active;
    return cast_.play();
}

util::EmptyResult PlaybackOrchestrator::seek(double seconds) {
    if (auto active = require_active(); active.is_err()) return active;
    return cast_.seek(seconds);
}

util::EmptyResult PlaybackOrchestrator::set_volume(double volume) {
    if (auto active = require_active(); active.is_err()) return active;
    return cast_.set_volume(volume);
}

util::EmptyResult PlaybackOrchestrator::stop() {
    std::optional<ActiveSession> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        session = std::move(active_);
        active_.reset();
    }
    if (!session) return util::success();

    util::Logger::info("Playback: Stopping session " + session->transfer_id);

    // Device first (best effort), then the transfer, which is never skipped
    if (session->cast_issued) {
        auto cast_stopped = cast_.stop();
        if (cast_stopped.is_err()) {
            util::Logger::warn("Playback: Device did not stop: " + cast_stopped.error().message);
        }
    }

    auto transfer_stopped = transfers_.stop(session->transfer_id);
    if (transfer_stopped.is_err() && transfer_stopped.code() != ErrorCode::SessionNotFound) {
        util::Logger::error("Playback: Transfer stop failed: " + transfer_stopped.error().message);
        return transfer_stopped;
    }

    PlaybackStatus stopped;
    stopped.state = model::UnifiedState::Stopped;
    stopped.detail = "stopped";
    publish_state(stopped);
    return util::success();
}

void PlaybackOrchestrator::shutdown() noexcept {
    try {
        auto stopped = stop();
        if (stopped.is_err()) {
            util::Logger::warn("Playback: Shutdown stop: " + stopped.error().message);
        }
    } catch (const std::exception& e) {
        util::Logger::error(std::string("Playback: Shutdown failed: ") + e.what());
    }
    transfers_.stop_all();
}

}  // namespace reelcast::playback
