#include "cast/CastGrammar.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <arpa/inet.h>

namespace reelcast::cast {

using model::CastState;

namespace {

constexpr std::string_view kSeparator = " - ";
constexpr double kSeekEndMargin = 0.5;

std::string trim(std::string_view text) {
    auto start = text.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos) return {};
    auto end = text.find_last_not_of(" \t\r\n");
    return std::string(text.substr(start, end - start + 1));
}

std::string lower(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return std::tolower(c); });
    return out;
}

bool is_ip_address(const std::string& text) {
    unsigned char buf[16];
    return ::inet_pton(AF_INET, text.c_str(), buf) == 1 || ::inet_pton(AF_INET6, text.c_str(), buf) == 1;
}

std::vector<std::string> split_parts(std::string_view line) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        auto pos = line.find(kSeparator, start);
        if (pos == std::string_view::npos) {
            parts.push_back(trim(line.substr(start)));
            break;
        }
        parts.push_back(trim(line.substr(start, pos - start)));
        start = pos + kSeparator.size();
    }
    return parts;
}

std::string join_parts(const std::vector<std::string>& parts, size_t from, size_t to) {
    std::string out;
    for (size_t i = from; i < to; ++i) {
        if (!out.empty()) out += kSeparator;
        out += parts[i];
    }
    return out;
}

std::optional<double> parse_number(const std::string& text) {
    double value = 0.0;
    auto result = std::from_chars(text.data(), text.data() + text.size(), value);
    if (result.ec != std::errc() || result.ptr != text.data() + text.size() || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

// Plain seconds ("1234.5") or a clock ("1:02:03", "02:03.5")
std::optional<double> parse_seconds(const std::string& text) {
    if (text.find(':') == std::string::npos) {
        auto value = parse_number(text);
        if (!value || *value < 0.0) return std::nullopt;
        return value;
    }
    double total = 0.0;
    size_t start = 0;
    int fields = 0;
    while (start <= text.size()) {
        auto pos = text.find(':', start);
        auto field = parse_number(text.substr(start, pos == std::string::npos ? std::string::npos : pos - start));
        if (!field || *field < 0.0) return std::nullopt;
        total = total * 60.0 + *field;
        if (++fields > 3) return std::nullopt;
        if (pos == std::string::npos) break;
        start = pos + 1;
    }
    return total;
}

}  // namespace

std::optional<model::CastTarget> parse_device_line(std::string_view raw) {
    std::string line = trim(raw);
    if (line.empty()) return std::nullopt;

    std::string folded = lower(line);
    if (folded.starts_with("scanning") || folded.find("no devices") != std::string::npos) {
        return std::nullopt;
    }

    auto parts = split_parts(line);
    if (parts.size() < 2) return std::nullopt;

    // catt >= 0.13: "192.168.1.36 - Living Room - Google Inc. Chromecast"
    if (is_ip_address(parts.front())) {
        model::CastTarget target;
        target.address = parts.front();
        target.name = parts[1];
        if (parts.size() >= 3) {
            target.model = join_parts(parts, 2, parts.size());
        }
        if (target.name.empty()) return std::nullopt;
        return target;
    }

    // Older form: "Living Room - 192.168.1.36"
    if (is_ip_address(parts.back())) {
        model::CastTarget target;
        target.address = parts.back();
        target.name = join_parts(parts, 0, parts.size() - 1);
        if (target.name.empty()) return std::nullopt;
        return target;
    }

    return std::nullopt;
}

std::vector<model::CastTarget> parse_scan_output(std::string_view output) {
    std::vector<model::CastTarget> devices;
    size_t start = 0;
    while (start < output.size()) {
        auto end = output.find('\n', start);
        if (end == std::string_view::npos) end = output.size();
        if (auto device = parse_device_line(output.substr(start, end - start))) {
            devices.push_back(std::move(*device));
        }
        start = end + 1;
    }
    return devices;
}

std::optional<CastState::Kind> parse_state_word(std::string_view word) {
    std::string w = lower(trim(word));
    if (w == "playing") return CastState::Kind::Playing;
    if (w == "paused") return CastState::Kind::Paused;
    if (w == "buffering" || w == "loading") return CastState::Kind::Buffering;
    if (w == "idle" || w == "unknown") return CastState::Kind::Idle;
    if (w == "stopped" || w == "finished") return CastState::Kind::Stopped;
    return std::nullopt;
}

StatusUpdate parse_status_output(std::string_view output) {
    StatusUpdate update;
    size_t start = 0;
    while (start < output.size()) {
        auto end = output.find('\n', start);
        if (end == std::string_view::npos) end = output.size();
        std::string_view line = output.substr(start, end - start);
        start = end + 1;

        auto colon = line.find(':');
        if (colon == std::string_view::npos) continue;
        std::string key = lower(trim(line.substr(0, colon)));
        std::string value = trim(line.substr(colon + 1));
        if (value.empty()) continue;

        if (key == "state") {
            if (auto kind = parse_state_word(value)) {
                update.state = CastState::of(*kind);
            }
        } else if (key == "duration") {
            update.duration_s = parse_seconds(value);
        } else if (key == "current time") {
            update.position_s = parse_seconds(value);
        } else if (key == "volume") {
            if (auto v = parse_number(value)) {
                update.volume = clamp_volume(*v / 100.0);
            }
        } else if (key == "title") {
            update.title = value;
        }
    }
    return update;
}

model::CastStatus merge_status(const model::CastStatus& cached, const StatusUpdate& update) {
    model::CastStatus merged = cached;
    if (update.state) merged.state = *update.state;
    if (update.position_s) merged.position_s = *update.position_s;
    if (update.duration_s && *update.duration_s > 0.0) merged.duration_s = update.duration_s;
    if (update.volume) merged.volume = *update.volume;
    if (update.title) merged.title = update.title;
    return merged;
}

double clamp_volume(double volume) {
    if (std::isnan(volume)) return 0.0;
    return std::clamp(volume, 0.0, 1.0);
}

util::Result<double> clamp_seek(double seconds, std::optional<double> duration_s) {
    if (std::isnan(seconds) || seconds < 0.0) {
        return util::make_error(util::ErrorCode::InvalidArgument,
            "seek position must be a non-negative number of seconds");
    }
    if (duration_s && *duration_s > 0.0 && seconds > *duration_s - kSeekEndMargin) {
        return std::max(0.0, *duration_s - kSeekEndMargin);
    }
    return seconds;
}

bool looks_unreachable(std::string_view output) {
    static constexpr std::string_view markers[] = {
        "unreachable",
        "no devices found",
        "not found",
        "could not connect",
        "connection refused",
        "no route to host",
        "timed out",
        "failed to connect",
    };
    std::string folded = lower(output);
    return std::any_of(std::begin(markers), std::end(markers), [&](std::string_view marker) {
        return folded.find(marker) != std::string::npos;
    });
}

}  // namespace reelcast::cast
