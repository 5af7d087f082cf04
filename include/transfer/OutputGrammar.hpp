#pragma once

#include "model/Session.hpp"
#include "util/Result.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace reelcast::transfer {

/**
 * Everything one line of transfer-process output told us. A single line can
 * carry several tokens ("Speed: 1 MB/s  Downloaded: 20 MB/700 MB"), so each
 * field is independent; parse_transfer_line() returns nullopt when none
 * matched.
 */
struct TransferLineEvent {
    bool connecting = false;
    std::optional<uint32_t> peers;
    std::optional<uint64_t> downloaded_bytes;
    std::optional<uint64_t> total_bytes;
    std::optional<uint64_t> rate_bytes_per_sec;
    std::optional<uint16_t> listening_port;
    std::optional<std::string> error;
    bool no_peers = false;  // set together with `error`

    bool operator==(const TransferLineEvent&) const = default;
};

struct ApplyOutcome {
    bool state_changed = false;
    bool url_resolved = false;
    bool progress_changed = false;
};

// Drop ANSI CSI/OSC escape sequences (the transfer tool redraws its screen)
std::string strip_ansi(std::string_view line);

// "5.2", "MB" -> 5200000. Decimal units: KB=10^3, MB=10^6, GB=10^9; binary
// spellings (KiB, MiB) are read as their decimal counterparts.
std::optional<uint64_t> parse_size(std::string_view number, std::string_view unit);

std::optional<TransferLineEvent> parse_transfer_line(std::string_view line);

// Fold one event into a session. Terminal sessions are left untouched.
// `lan_address` is the host advertised in the resolved stream URL.
ApplyOutcome apply_event(model::TransferSession& session,
                         const TransferLineEvent& event,
                         const std::string& lan_address);

// Process exit that nobody asked for: non-zero is an Error, zero a Stop.
ApplyOutcome apply_exit(model::TransferSession& session, int exit_status);

std::string stream_url_for(const std::string& lan_address, uint16_t port,
                           std::optional<uint32_t> file_index);

// Syntactic magnet check; InvalidLocator with a human-readable reason.
util::EmptyResult validate_locator(std::string_view locator);

std::optional<std::string> extract_info_hash(std::string_view locator);

}  // namespace reelcast::transfer
