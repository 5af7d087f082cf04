#include "util/Result.hpp"

namespace reelcast::util {

std::string_view error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidLocator:    return "invalid_locator";
        case ErrorCode::InvalidArgument:   return "invalid_argument";
        case ErrorCode::LaunchNotFound:    return "launch_not_found";
        case ErrorCode::SpawnFailed:       return "spawn_failed";
        case ErrorCode::ParseError:        return "parse_error";
        case ErrorCode::Timeout:           return "timeout";
        case ErrorCode::DeviceUnreachable: return "device_unreachable";
        case ErrorCode::CastFailed:        return "cast_failed";
        case ErrorCode::NoPeers:           return "no_peers";
        case ErrorCode::TransferFailed:    return "transfer_failed";
        case ErrorCode::NoTarget:          return "no_target";
        case ErrorCode::NoActiveSession:   return "no_active_session";
        case ErrorCode::SessionNotFound:   return "session_not_found";
        case ErrorCode::InvalidState:      return "invalid_state";
        case ErrorCode::IoError:           return "io_error";
    }
    return "unknown";
}

}  // namespace reelcast::util
