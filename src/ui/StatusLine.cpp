#include "ui/StatusLine.hpp"
#include "ui/Formatting.hpp"
#include <cmath>
#include <format>

namespace reelcast::ui {

namespace {

constexpr int kBarWidth = 22;

std::string capitalize(std::string text) {
    if (!text.empty() && text[0] >= 'a' && text[0] <= 'z') {
        text[0] = static_cast<char>(text[0] - 'a' + 'A');
    }
    return text;
}

std::string position_text(const model::CastStatus& cast) {
    std::string text = format_clock(cast.position_s);
    if (cast.duration_s) {
        text += " / " + format_clock(*cast.duration_s);
    }
    return text;
}

}  // namespace

std::string transfer_line(const model::TransferSession& session, int width) {
    std::string left = capitalize(model::to_string(session.state));

    std::string right;
    if (session.total_bytes) {
        right = progress_bar(session.progress, kBarWidth) +
                std::format(" {:3.0f}%", session.progress * 100.0);
    } else if (session.bytes_transferred > 0) {
        right = format_bytes(session.bytes_transferred);
    }
    if (session.rate_bytes_per_sec > 0) {
        right += "  " + format_rate(session.rate_bytes_per_sec);
    }
    if (session.peers) {
        right += std::format("  {} peers", *session.peers);
    }
    return trunc_pad(lr_align(width, left, right), width);
}

std::string playback_line(const playback::PlaybackStatus& status, int width) {
    std::string left = capitalize(model::to_string(status.state));
    if (status.cast && status.cast->title) {
        left += "  " + *status.cast->title;
    }

    std::string right;
    if (status.state == model::UnifiedState::Preparing && status.transfer) {
        return transfer_line(*status.transfer, width);
    }
    if (status.cast) {
        right = position_text(*status.cast) +
                std::format("  vol {}%", static_cast<int>(std::lround(status.cast->volume * 100.0)));
    }
    if (status.transfer && status.transfer->rate_bytes_per_sec > 0) {
        right += "  " + format_rate(status.transfer->rate_bytes_per_sec);
    }
    return trunc_pad(lr_align(width, left, right), width);
}

std::string cast_status_text(const model::CastStatus& status) {
    std::string text = "State:    " + capitalize(model::to_string(status.state)) + "\n";
    text += "Position: " + position_text(status) + "\n";
    text += std::format("Volume:   {}%", static_cast<int>(std::lround(status.volume * 100.0)));
    if (status.title) {
        text += "\nTitle:    " + *status.title;
    }
    return text;
}

}  // namespace reelcast::ui
