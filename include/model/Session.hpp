#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace reelcast::model {

using SessionId = std::string;

struct TransferState {
    enum class Kind {
        Starting,
        Connecting,
        Downloading,
        Streaming,
        Paused,
        Stopped,
        Error,
    };

    Kind kind = Kind::Starting;
    std::string reason;     // Error only
    bool no_peers = false;  // Error only: the swarm had nobody to download from

    static TransferState of(Kind k) { return TransferState{k, {}, false}; }
    static TransferState error(std::string why) { return TransferState{Kind::Error, std::move(why), false}; }
    static TransferState peerless(std::string why) { return TransferState{Kind::Error, std::move(why), true}; }

    bool is_terminal() const { return kind == Kind::Stopped || kind == Kind::Error; }
    // Streaming and Paused keep the HTTP server up, so the URL resolves
    bool has_stream() const { return kind == Kind::Streaming || kind == Kind::Paused; }

    bool operator==(const TransferState&) const = default;
};

// Forward-order rank used to keep transitions monotonic
int rank(TransferState::Kind kind);
std::string to_string(const TransferState& state);

struct TransferSession {
    SessionId id;
    std::string locator;
    std::optional<uint32_t> file_index;
    TransferState state;

    std::optional<std::string> stream_url;
    uint16_t port = 0;

    double progress = 0.0;               // [0, 1], never regresses
    uint64_t rate_bytes_per_sec = 0;     // last observed sample
    uint64_t bytes_transferred = 0;      // never regresses
    std::optional<uint64_t> total_bytes;
    std::optional<uint32_t> peers;
    uint32_t restarts = 0;

    bool operator==(const TransferSession&) const = default;
};

struct CastTarget {
    std::string name;
    std::string address;
    std::optional<std::string> model;

    bool operator==(const CastTarget&) const = default;
};

struct CastState {
    enum class Kind {
        Idle,
        Connecting,
        Buffering,
        Playing,
        Paused,
        Stopped,
        Error,
    };

    Kind kind = Kind::Idle;
    std::string reason;

    static CastState of(Kind k) { return CastState{k, {}}; }
    static CastState error(std::string why) { return CastState{Kind::Error, std::move(why)}; }

    bool operator==(const CastState&) const = default;
};

std::string to_string(const CastState& state);

struct CastStatus {
    CastState state;
    double position_s = 0.0;
    std::optional<double> duration_s;   // unknown until the device reports it
    double volume = 1.0;                // [0, 1]
    std::optional<std::string> title;

    bool operator==(const CastStatus&) const = default;
};

enum class UnifiedState {
    Idle,
    Preparing,
    Casting,
    Playing,
    Paused,
    Stopped,
    Error,
};

std::string to_string(UnifiedState state);

// What to do when the transfer dies while the device still plays buffered media
enum class TransferLossPolicy {
    Warn,       // report Error with a warning, leave the device alone
    StopCast,   // report Error and stop the device
};

std::string to_string(TransferLossPolicy policy);

}  // namespace reelcast::model
