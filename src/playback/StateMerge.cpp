#include "playback/StateMerge.hpp"

namespace reelcast::playback {

using model::CastState;
using model::TransferState;
using model::UnifiedState;

namespace {

UnifiedStatus from_cast(const std::optional<model::CastStatus>& cast) {
    if (!cast) {
        return {UnifiedState::Casting, "waiting for the device"};
    }
    switch (cast->state.kind) {
        case CastState::Kind::Idle:       return {UnifiedState::Casting, "waiting for the device"};
        case CastState::Kind::Connecting: return {UnifiedState::Casting, "connecting"};
        case CastState::Kind::Buffering:  return {UnifiedState::Casting, "buffering"};
        case CastState::Kind::Playing:    return {UnifiedState::Playing, "playing"};
        case CastState::Kind::Paused:     return {UnifiedState::Paused, "paused"};
        case CastState::Kind::Stopped:    return {UnifiedState::Stopped, "stopped"};
        case CastState::Kind::Error:      return {UnifiedState::Error, cast->state.reason};
    }
    return {UnifiedState::Error, "unknown cast state"};
}

bool device_still_rendering(const std::optional<model::CastStatus>& cast) {
    if (!cast) return false;
    auto kind = cast->state.kind;
    return kind == CastState::Kind::Playing || kind == CastState::Kind::Paused ||
           kind == CastState::Kind::Buffering;
}

}  // namespace

UnifiedStatus merge(const std::optional<TransferState>& transfer,
                    const std::optional<model::CastStatus>& cast,
                    model::TransferLossPolicy policy) {
    if (!transfer) {
        return {UnifiedState::Idle, "no active session"};
    }

    switch (transfer->kind) {
        case TransferState::Kind::Starting:
        case TransferState::Kind::Connecting:
        case TransferState::Kind::Downloading:
            return {UnifiedState::Preparing, model::to_string(*transfer)};

        case TransferState::Kind::Streaming:
        case TransferState::Kind::Paused:
            return from_cast(cast);

        case TransferState::Kind::Stopped:
            return {UnifiedState::Stopped, "transfer stopped"};

        case TransferState::Kind::Error:
            break;
    }

    const std::string& reason = transfer->reason;
    if (cast && cast->state.kind == CastState::Kind::Error) {
        return {UnifiedState::Error, "transfer: " + reason + "; device: " + cast->state.reason};
    }
    if (device_still_rendering(cast)) {
        UnifiedStatus status{UnifiedState::Error, reason};
        if (policy == model::TransferLossPolicy::StopCast) {
            status.stop_cast = true;
        } else {
            status.warning = "transfer failed; the device is playing buffered media and will stall";
        }
        return status;
    }
    return {UnifiedState::Error, reason};
}

}  // namespace reelcast::playback
