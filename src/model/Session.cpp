#include "model/Session.hpp"

namespace reelcast::model {

int rank(TransferState::Kind kind) {
    switch (kind) {
        case TransferState::Kind::Starting:    return 0;
        case TransferState::Kind::Connecting:  return 1;
        case TransferState::Kind::Downloading: return 2;
        case TransferState::Kind::Streaming:   return 3;
        case TransferState::Kind::Paused:      return 4;
        case TransferState::Kind::Stopped:     return 5;
        case TransferState::Kind::Error:       return 6;
    }
    return 0;
}

std::string to_string(const TransferState& state) {
    switch (state.kind) {
        case TransferState::Kind::Starting:    return "starting";
        case TransferState::Kind::Connecting:  return "connecting";
        case TransferState::Kind::Downloading: return "downloading";
        case TransferState::Kind::Streaming:   return "streaming";
        case TransferState::Kind::Paused:      return "paused";
        case TransferState::Kind::Stopped:     return "stopped";
        case TransferState::Kind::Error:       return "error: " + state.reason;
    }
    return "unknown";
}

std::string to_string(const CastState& state) {
    switch (state.kind) {
        case CastState::Kind::Idle:       return "idle";
        case CastState::Kind::Connecting: return "connecting";
        case CastState::Kind::Buffering:  return "buffering";
        case CastState::Kind::Playing:    return "playing";
        case CastState::Kind::Paused:     return "paused";
        case CastState::Kind::Stopped:    return "stopped";
        case CastState::Kind::Error:      return "error: " + state.reason;
    }
    return "unknown";
}

std::string to_string(UnifiedState state) {
    switch (state) {
        case UnifiedState::Idle:      return "idle";
        case UnifiedState::Preparing: return "preparing";
        case UnifiedState::Casting:   return "casting";
        case UnifiedState::Playing:   return "playing";
        case UnifiedState::Paused:    return "paused";
        case UnifiedState::Stopped:   return "stopped";
        case UnifiedState::Error:     return "error";
    }
    return "unknown";
}

std::string to_string(TransferLossPolicy policy) {
    return policy == TransferLossPolicy::StopCast ? "stop" : "warn";
}

}  // namespace reelcast::model
