#include "backend/Config.hpp"
#include "util/Logger.hpp"
#include "util/Platform.hpp"
#include <charconv>
#include <fstream>
#include <sstream>
#include <string>

namespace reelcast::backend {

namespace {

std::string trim(const std::string& text) {
    auto start = text.find_first_not_of(" \t\r");
    if (start == std::string::npos) return {};
    auto end = text.find_last_not_of(" \t\r");
    return text.substr(start, end - start + 1);
}

// Invalid numbers keep the default and leave a warning in the log
void parse_int(const std::string& key, const std::string& value, int& out, int min_value) {
    int parsed = 0;
    auto result = std::from_chars(value.data(), value.data() + value.size(), parsed);
    if (result.ec != std::errc() || result.ptr != value.data() + value.size() || parsed < min_value) {
        util::Logger::warn("Config: Ignoring invalid value for " + key + ": '" + value + "'");
        return;
    }
    out = parsed;
}

std::vector<std::string> split_args(const std::string& value) {
    std::vector<std::string> args;
    std::istringstream stream(value);
    std::string arg;
    while (stream >> arg) {
        args.push_back(arg);
    }
    return args;
}

std::string join_args(const std::vector<std::string>& args) {
    std::string out;
    for (const auto& arg : args) {
        if (!out.empty()) out += ' ';
        out += arg;
    }
    return out;
}

}  // namespace

Config ConfigLoader::load_config(const std::optional<std::filesystem::path>& override_path) {
    util::Logger::info("Config: Loading configuration");

    auto config_file = override_path.value_or(get_config_file());
    std::error_code ec;
    if (std::filesystem::exists(config_file, ec)) {
        return load_from_file(config_file);
    }
    if (override_path) {
        util::Logger::warn("Config: " + config_file.string() + " does not exist, using defaults");
    }
    return create_default_config();
}

Config ConfigLoader::load_from_file(const std::filesystem::path& path) {
    util::Logger::debug("Config: Loading from " + path.string());

    Config cfg = create_default_config();

    std::ifstream file(path);
    if (!file) {
        util::Logger::warn("Config: Cannot read " + path.string());
        return cfg;
    }

    std::string line, current_section;
    while (std::getline(file, line)) {
        line = trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') continue;

        // Section header
        if (line[0] == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.length() - 2));
            continue;
        }

        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) continue;

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove quotes from strings
        if (value.length() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.length() - 2);
        } else if (auto hash = value.find(" #"); hash != std::string::npos) {
            value = trim(value.substr(0, hash));
        }

        std::string full_key = current_section + "." + key;

        if (current_section == "transfer") {
            if (key == "webtorrent_path") cfg.transfer.webtorrent_path = value;
            else if (key == "port") {
                int port = cfg.transfer.port;
                parse_int(full_key, value, port, 0);
                if (port <= 65535) {
                    cfg.transfer.port = static_cast<uint16_t>(port);
                } else {
                    util::Logger::warn("Config: Ignoring out-of-range port " + value);
                }
            }
            else if (key == "ready_timeout_ms") parse_int(full_key, value, cfg.transfer.ready_timeout_ms, 1);
            else if (key == "stop_grace_ms") parse_int(full_key, value, cfg.transfer.stop_grace_ms, 0);
            else if (key == "extra_args") cfg.transfer.extra_args = split_args(value);
            else if (key == "lan_address") cfg.transfer.lan_address = value;
        }
        else if (current_section == "cast") {
            if (key == "catt_path") cfg.cast.catt_path = value;
            else if (key == "default_device") cfg.cast.default_device = value;
            else if (key == "discovery_timeout_ms") parse_int(full_key, value, cfg.cast.discovery_timeout_ms, 1);
            else if (key == "command_timeout_ms") parse_int(full_key, value, cfg.cast.command_timeout_ms, 1);
        }
        else if (current_section == "playback") {
            if (key == "on_transfer_loss") {
                if (value == "warn") cfg.playback.on_transfer_loss = model::TransferLossPolicy::Warn;
                else if (value == "stop") cfg.playback.on_transfer_loss = model::TransferLossPolicy::StopCast;
                else util::Logger::warn("Config: Unknown on_transfer_loss '" + value + "', keeping warn");
            }
            else if (key == "poll_interval_ms") parse_int(full_key, value, cfg.playback.poll_interval_ms, 50);
        }
        else if (current_section == "subtitles") {
            if (key == "cache_dir" && !value.empty()) cfg.subtitles.cache_dir = value;
            else if (key == "languages") cfg.subtitles.languages = value;
        }
        else if (current_section == "log") {
            if (key == "file" && !value.empty()) cfg.log.file = value;
            else if (key == "level") cfg.log.level = value;
        }
    }

    return cfg;
}

bool ConfigLoader::save_config(const Config& cfg, const std::filesystem::path& path) {
    util::Logger::info("Config: Saving configuration to " + path.string());

    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            util::Logger::error("Config: Cannot create " + path.parent_path().string() + ": " + ec.message());
            return false;
        }
    }

    std::ofstream file(path);
    if (!file) {
        util::Logger::error("Config: Cannot write " + path.string());
        return false;
    }

    file << "# reelcast config\n";
    file << "# Generated with defaults; edit with care\n\n";

    file << "[transfer]\n";
    file << "# Transfer client executable (name on PATH or absolute path)\n";
    file << "webtorrent_path = \"" << cfg.transfer.webtorrent_path << "\"\n\n";
    file << "# HTTP port for the stream server (0 = pick a free port)\n";
    file << "port = " << cfg.transfer.port << "\n\n";
    file << "# How long play waits for the stream to come up\n";
    file << "ready_timeout_ms = " << cfg.transfer.ready_timeout_ms << "\n\n";
    file << "# Grace period between SIGTERM and SIGKILL on stop\n";
    file << "stop_grace_ms = " << cfg.transfer.stop_grace_ms << "\n\n";
    file << "# Extra arguments appended to the transfer command line\n";
    file << "extra_args = \"" << join_args(cfg.transfer.extra_args) << "\"\n\n";
    file << "# Address advertised to the display device (empty = detect)\n";
    file << "lan_address = \"" << cfg.transfer.lan_address << "\"\n\n";

    file << "[cast]\n";
    file << "catt_path = \"" << cfg.cast.catt_path << "\"\n";
    file << "# Device used when -d is not given\n";
    file << "default_device = \"" << cfg.cast.default_device << "\"\n";
    file << "discovery_timeout_ms = " << cfg.cast.discovery_timeout_ms << "\n";
    file << "command_timeout_ms = " << cfg.cast.command_timeout_ms << "\n\n";

    file << "[playback]\n";
    file << "# When the transfer fails mid-playback: \"warn\" or \"stop\"\n";
    file << "on_transfer_loss = \"" << model::to_string(cfg.playback.on_transfer_loss) << "\"\n";
    file << "poll_interval_ms = " << cfg.playback.poll_interval_ms << "\n\n";

    file << "[subtitles]\n";
    if (!cfg.subtitles.cache_dir.empty()) {
        file << "cache_dir = \"" << cfg.subtitles.cache_dir.string() << "\"\n";
    } else {
        file << "# cache_dir = \"~/.cache/reelcast/subtitles\"\n";
    }
    file << "languages = \"" << cfg.subtitles.languages << "\"\n\n";

    file << "[log]\n";
    file << "file = \"" << cfg.log.file.string() << "\"\n";
    file << "# debug, info, warn, error\n";
    file << "level = \"" << cfg.log.level << "\"\n";

    return static_cast<bool>(file);
}

std::filesystem::path ConfigLoader::get_config_file() {
    return util::Platform::get_config_directory() / "config.toml";
}

Config ConfigLoader::create_default_config() {
    Config cfg;
    cfg.subtitles.cache_dir = util::Platform::get_cache_directory() / "subtitles";
    return cfg;
}

}  // namespace reelcast::backend
