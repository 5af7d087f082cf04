#pragma once

#include "model/Session.hpp"
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace reelcast::backend {

struct TransferSettings {
    std::string webtorrent_path = "webtorrent";
    uint16_t port = 0;                      // 0 = any free port
    int ready_timeout_ms = 120000;
    int stop_grace_ms = 1500;
    std::vector<std::string> extra_args;
    std::string lan_address;                // empty = detect
};

struct CastSettings {
    std::string catt_path = "catt";
    std::string default_device;
    int discovery_timeout_ms = 5000;
    int command_timeout_ms = 8000;
};

struct PlaybackSettings {
    model::TransferLossPolicy on_transfer_loss = model::TransferLossPolicy::Warn;
    int poll_interval_ms = 1000;
};

struct SubtitleSettings {
    std::filesystem::path cache_dir;        // empty = <cache dir>/subtitles
    std::string languages = "en";
};

struct LogSettings {
    std::filesystem::path file = "/tmp/reelcast_debug.log";
    std::string level = "info";
};

struct Config {
    TransferSettings transfer;
    CastSettings cast;
    PlaybackSettings playback;
    SubtitleSettings subtitles;
    LogSettings log;
};

class ConfigLoader {
public:
    // `override_path` comes from --config; otherwise the per-user file
    static Config load_config(const std::optional<std::filesystem::path>& override_path = std::nullopt);
    static Config load_from_file(const std::filesystem::path& path);
    static bool save_config(const Config& cfg, const std::filesystem::path& path);

    static std::filesystem::path get_config_file();

private:
    static Config create_default_config();
};

}  // namespace reelcast::backend
