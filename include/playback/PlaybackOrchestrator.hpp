#pragma once

#include "model/Session.hpp"
#include "playback/StateMerge.hpp"
#include "util/Result.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace reelcast::cast { class CastController; }
namespace reelcast::events { class EventBus; }
namespace reelcast::subtitles { class SubtitleStager; }
namespace reelcast::transfer { class TransferManager; }

namespace reelcast::playback {

struct PlayOptions {
    std::optional<uint32_t> file_index;
    std::optional<uint64_t> expected_size_bytes;
    std::optional<std::string> title;
    std::optional<std::string> subtitle;   // .srt/.vtt path or a URL
    std::chrono::milliseconds ready_timeout{120000};
    std::function<bool()> should_cancel;   // polled while waiting for the stream
};

struct PlaybackStatus {
    model::UnifiedState state = model::UnifiedState::Idle;
    std::string detail;
    std::optional<std::string> warning;
    std::optional<util::ErrorCode> error_code;   // Error only: which side gave up and how
    std::optional<model::TransferSession> transfer;
    std::optional<model::CastStatus> cast;
    std::optional<model::CastTarget> target;
};

/**
 * "Now playing": one transfer session feeding one cast target.
 *
 * play() starts (or reuses) the transfer, waits for its stream URL and hands
 * the URL to the device. status() merges both sides into a UnifiedState.
 * stop() always tears the transfer down even when the device does not
 * answer. Only one playback is active at a time.
 */
class PlaybackOrchestrator {
public:
    PlaybackOrchestrator(transfer::TransferManager& transfers,
                         cast::CastController& cast,
                         const subtitles::SubtitleStager* stager = nullptr,
                         model::TransferLossPolicy policy = model::TransferLossPolicy::Warn,
                         events::EventBus* bus = nullptr);
    ~PlaybackOrchestrator();

    PlaybackOrchestrator(const PlaybackOrchestrator&) = delete;
    PlaybackOrchestrator& operator=(const PlaybackOrchestrator&) = delete;

    util::Result<PlaybackStatus> play(const std::string& locator,
                                      const model::CastTarget& target,
                                      const PlayOptions& options = {});

    // Cast the active session's stream again (after CastFailed/DeviceUnreachable
    // or a ready-timeout)
    util::EmptyResult resume_cast();

    PlaybackStatus status();

    util::EmptyResult pause();
    util::EmptyResult resume();
    util::EmptyResult seek(double seconds);
    util::EmptyResult set_volume(double volume);

    util::EmptyResult stop();
    void shutdown() noexcept;

    std::optional<model::SessionId> active_session() const;

private:
    struct ActiveSession {
        model::SessionId transfer_id;
        model::CastTarget target;
        std::string locator;
        PlayOptions options;
        std::optional<std::string> subtitle;   // what the device gets (staged)
        bool cast_issued = false;
        std::optional<util::ErrorCode> cast_error;   // last cast attempt failed
        bool stopped_for_loss = false;
    };

    util::Result<std::string> wait_for_stream(const model::SessionId& id, const PlayOptions& options);
    util::Result<std::optional<std::string>> resolve_subtitle(const PlayOptions& options) const;
    util::EmptyResult cast_active(const ActiveSession& session, const std::string& url);
    util::EmptyResult require_active() const;
    void publish_state(const PlaybackStatus& status);

    transfer::TransferManager& transfers_;
    cast::CastController& cast_;
    const subtitles::SubtitleStager* stager_;
    model::TransferLossPolicy policy_;
    events::EventBus* bus_;

    std::optional<ActiveSession> active_;
    std::optional<model::UnifiedState> last_published_;
    mutable std::mutex mutex_;
};

}  // namespace reelcast::playback
