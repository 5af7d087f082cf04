#pragma once

#include "util/Result.hpp"
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace reelcast::cli {

// "90", "5:30", "1:30:00" go to a position; "+30" and "-10" move from the
// current one
struct SeekTarget {
    double seconds = 0.0;
    bool relative = false;

    bool operator==(const SeekTarget&) const = default;
};

// "40" sets the level (capped at 100); "+10" and "-5" adjust it
struct VolumeTarget {
    double percent = 0.0;
    bool relative = false;

    bool operator==(const VolumeTarget&) const = default;
};

std::optional<SeekTarget> parse_seek_position(std::string_view text);
std::optional<VolumeTarget> parse_volume_level(std::string_view text);

// Absolute position in seconds, never negative
double resolve_seek(const SeekTarget& target, double position_s);
// Device volume in [0, 1]
double resolve_volume(const VolumeTarget& target, double current);

struct Invocation {
    std::string command;   // devices, stream, play, status, resume, pause, stop, seek, volume, help

    // Global
    std::optional<std::string> device;
    bool json = false;
    std::optional<std::filesystem::path> config_path;

    // Per command
    std::optional<std::string> magnet;
    std::optional<uint32_t> file_index;
    std::optional<std::string> subtitle;
    std::optional<std::string> title;
    std::optional<int> timeout_s;
    std::optional<SeekTarget> seek;
    std::optional<VolumeTarget> volume;
    bool kill_stream = false;   // stop: also end the local transfer process
    bool watch = false;         // status: keep polling
    int interval_s = 1;         // status --watch poll period
};

// argv without the program name. InvalidArgument carries a usage hint.
util::Result<Invocation> parse_arguments(const std::vector<std::string>& args);

std::string usage();

}  // namespace reelcast::cli
