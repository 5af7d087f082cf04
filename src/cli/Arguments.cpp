#include "cli/Arguments.hpp"
#include <algorithm>
#include <charconv>
#include <cmath>
#include <set>

namespace reelcast::cli {

using util::ErrorCode;

namespace {

const std::set<std::string> kCommands = {
    "devices", "stream", "play", "status", "resume", "pause", "stop", "seek", "volume", "help",
};

util::Error bad(const std::string& message) {
    return util::make_error(ErrorCode::InvalidArgument, message);
}

template <typename T>
std::optional<T> parse_number(const std::string& text) {
    T value{};
    auto result = std::from_chars(text.data(), text.data() + text.size(), value);
    if (result.ec != std::errc() || result.ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

std::optional<double> parse_clock(std::string_view text) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        auto colon = text.find(':', start);
        parts.emplace_back(text.substr(start, colon == std::string_view::npos ? colon : colon - start));
        if (colon == std::string_view::npos) break;
        start = colon + 1;
    }
    if (parts.size() < 2 || parts.size() > 3) return std::nullopt;

    double total = 0.0;
    for (size_t i = 0; i < parts.size(); i++) {
        auto field = parse_number<uint32_t>(parts[i]);
        if (!field) return std::nullopt;
        // Minutes and seconds after the leading field stay below 60
        if (i > 0 && *field >= 60) return std::nullopt;
        total = total * 60.0 + *field;
    }
    return total;
}

}  // namespace

std::optional<SeekTarget> parse_seek_position(std::string_view text) {
    if (text.empty()) return std::nullopt;

    if (text[0] == '+' || text[0] == '-') {
        auto delta = parse_number<double>(std::string(text.substr(1)));
        if (!delta || !std::isfinite(*delta) || *delta < 0.0) return std::nullopt;
        return SeekTarget{text[0] == '-' ? -*delta : *delta, true};
    }
    if (text.find(':') != std::string_view::npos) {
        auto seconds = parse_clock(text);
        if (!seconds) return std::nullopt;
        return SeekTarget{*seconds, false};
    }
    auto seconds = parse_number<double>(std::string(text));
    if (!seconds || !std::isfinite(*seconds) || *seconds < 0.0) return std::nullopt;
    return SeekTarget{*seconds, false};
}

std::optional<VolumeTarget> parse_volume_level(std::string_view text) {
    if (text.empty()) return std::nullopt;

    if (text[0] == '+' || text[0] == '-') {
        auto delta = parse_number<double>(std::string(text.substr(1)));
        if (!delta || !std::isfinite(*delta) || *delta < 0.0) return std::nullopt;
        return VolumeTarget{text[0] == '-' ? -*delta : *delta, true};
    }
    auto level = parse_number<double>(std::string(text));
    if (!level || std::isnan(*level) || *level < 0.0) return std::nullopt;
    return VolumeTarget{std::min(*level, 100.0), false};
}

double resolve_seek(const SeekTarget& target, double position_s) {
    double seconds = target.relative ? position_s + target.seconds : target.seconds;
    return std::max(seconds, 0.0);
}

double resolve_volume(const VolumeTarget& target, double current) {
    double percent = target.relative ? current * 100.0 + target.percent : target.percent;
    return std::clamp(percent, 0.0, 100.0) / 100.0;
}

std::string usage() {
    return
        "Usage: reelcast [options] <command> [args]\n"
        "\n"
        "Commands:\n"
        "  devices [--timeout S]          Scan the network for cast devices\n"
        "  stream <magnet> [--file-idx N] Serve a magnet over HTTP until interrupted\n"
        "  play <magnet> [--file-idx N] [--subtitle FILE] [--title T] [--timeout S]\n"
        "                                 Stream a magnet to the selected device\n"
        "  status [--watch] [-i S]        Show what the device is playing\n"
        "  resume | pause                 Control playback on the device\n"
        "  stop [--kill-stream]           Stop the device (and the local transfer)\n"
        "  seek <pos>                     Jump to 90, 5:30, 1:30:00, +30 or -10\n"
        "  volume <level>                 Set 0-100, or adjust with +10 / -5\n"
        "\n"
        "Options:\n"
        "  -d, --device NAME              Cast device (default: config cast.default_device)\n"
        "  --json                         Machine-readable output\n"
        "  -c, --config PATH              Config file (default: ~/.config/reelcast/config.toml)\n"
        "  -h, --help                     Show this help\n";
}

util::Result<Invocation> parse_arguments(const std::vector<std::string>& args) {
    Invocation inv;
    std::vector<std::string> positionals;
    std::optional<std::string> short_i;   // --file-idx, or --interval for status
    std::optional<std::string> interval;

    for (size_t i = 0; i < args.size(); i++) {
        const std::string& arg = args[i];
        auto next = [&]() -> std::optional<std::string> {
            if (i + 1 >= args.size()) return std::nullopt;
            return args[++i];
        };

        if (arg == "-h" || arg == "--help") {
            inv.command = "help";
            return inv;
        }
        else if (arg == "--json") {
            inv.json = true;
        }
        else if (arg == "-d" || arg == "--device") {
            auto value = next();
            if (!value || value->empty()) return bad(arg + " needs a device name");
            inv.device = *value;
        }
        else if (arg == "-c" || arg == "--config") {
            auto value = next();
            if (!value || value->empty()) return bad(arg + " needs a path");
            inv.config_path = std::filesystem::path(*value);
        }
        else if (arg == "-i") {
            auto value = next();
            if (!value) return bad("-i needs a value");
            short_i = *value;
        }
        else if (arg == "--file-idx") {
            auto value = next();
            auto index = value ? parse_number<uint32_t>(*value) : std::nullopt;
            if (!index) return bad("--file-idx needs a non-negative integer");
            inv.file_index = index;
        }
        else if (arg == "--subtitle" || arg == "-s") {
            auto value = next();
            if (!value || value->empty()) return bad("--subtitle needs a file");
            inv.subtitle = *value;
        }
        else if (arg == "--title" || arg == "-t") {
            auto value = next();
            if (!value) return bad("--title needs a value");
            inv.title = *value;
        }
        else if (arg == "--timeout") {
            auto value = next();
            auto seconds = value ? parse_number<int>(*value) : std::nullopt;
            if (!seconds || *seconds <= 0) return bad("--timeout needs a positive number of seconds");
            inv.timeout_s = seconds;
        }
        else if (arg == "--interval") {
            auto value = next();
            if (!value) return bad("--interval needs a value");
            interval = *value;
        }
        else if (arg == "--watch" || arg == "-w") {
            inv.watch = true;
        }
        else if (arg == "--kill-stream") {
            inv.kill_stream = true;
        }
        else if (arg.size() > 1 && arg[0] == '-' && !parse_seek_position(arg)) {
            return bad("unknown option " + arg);
        }
        else {
            positionals.push_back(arg);
        }
    }

    if (positionals.empty()) {
        return bad("missing command");
    }
    inv.command = positionals.front();
    positionals.erase(positionals.begin());
    if (!kCommands.count(inv.command)) {
        return bad("unknown command '" + inv.command + "'");
    }

    if (short_i && inv.command == "status") {
        interval = short_i;
        short_i.reset();
    }
    if (interval) {
        if (inv.command != "status") return bad("--interval only applies to status");
        auto seconds = parse_number<int>(*interval);
        if (!seconds || *seconds <= 0) return bad("--interval needs a positive number of seconds");
        inv.interval_s = *seconds;
    }
    if (short_i) {
        auto index = parse_number<uint32_t>(*short_i);
        if (!index) return bad("--file-idx needs a non-negative integer");
        inv.file_index = index;
    }

    auto expect_args = [&](size_t count) -> util::EmptyResult {
        if (positionals.size() < count) {
            return bad(inv.command + ": missing argument");
        }
        if (positionals.size() > count) {
            return bad(inv.command + ": unexpected argument '" + positionals[count] + "'");
        }
        return util::success();
    };

    if (inv.command == "stream" || inv.command == "play") {
        if (auto ok = expect_args(1); ok.is_err()) return ok.error();
        inv.magnet = positionals[0];
    }
    else if (inv.command == "seek") {
        if (auto ok = expect_args(1); ok.is_err()) return ok.error();
        inv.seek = parse_seek_position(positionals[0]);
        if (!inv.seek) return bad("seek needs seconds, MM:SS, HH:MM:SS, +N or -N");
    }
    else if (inv.command == "volume") {
        if (auto ok = expect_args(1); ok.is_err()) return ok.error();
        inv.volume = parse_volume_level(positionals[0]);
        if (!inv.volume) return bad("volume needs a level between 0 and 100, +N or -N");
    }
    else {
        if (auto ok = expect_args(0); ok.is_err()) return ok.error();
    }

    return inv;
}

}  // namespace reelcast::cli
