#pragma once

#include "model/Session.hpp"
#include "util/Result.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace reelcast::cast {

// Fields one `status` invocation reported; missing fields keep cached values
struct StatusUpdate {
    std::optional<model::CastState> state;
    std::optional<double> position_s;
    std::optional<double> duration_s;
    std::optional<double> volume;
    std::optional<std::string> title;

    bool empty() const {
        return !state && !position_s && !duration_s && !volume && !title;
    }
};

// "<name> - <ip>" or "<ip> - <name> - <model>". Banners and garbage -> nullopt.
std::optional<model::CastTarget> parse_device_line(std::string_view line);
std::vector<model::CastTarget> parse_scan_output(std::string_view output);

std::optional<model::CastState::Kind> parse_state_word(std::string_view word);
StatusUpdate parse_status_output(std::string_view output);
model::CastStatus merge_status(const model::CastStatus& cached, const StatusUpdate& update);

// [0, 1]; NaN reads as 0
double clamp_volume(double volume);

// Negative or NaN is InvalidArgument; past a known end lands 0.5 s before it
util::Result<double> clamp_seek(double seconds, std::optional<double> duration_s);

// Does the control tool's output say the device could not be reached?
bool looks_unreachable(std::string_view output);

}  // namespace reelcast::cast
