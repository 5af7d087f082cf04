#pragma once

#include "model/Session.hpp"
#include "playback/PlaybackOrchestrator.hpp"
#include <string>

namespace reelcast::ui {

// "Downloading [####------] 42%  5.2 MB/s  12 peers", fitted to `width`
std::string transfer_line(const model::TransferSession& session, int width);

// "Playing  01:02 / 45:00  vol 80%  Title", fitted to `width`
std::string playback_line(const playback::PlaybackStatus& status, int width);

// One-shot `status` output for humans
std::string cast_status_text(const model::CastStatus& status);

}  // namespace reelcast::ui
