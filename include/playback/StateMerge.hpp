#pragma once

#include "model/Session.hpp"
#include <optional>
#include <string>

namespace reelcast::playback {

struct UnifiedStatus {
    model::UnifiedState state = model::UnifiedState::Idle;
    std::string detail;
    std::optional<std::string> warning;
    bool stop_cast = false;   // the caller should stop the device once

    bool operator==(const UnifiedStatus&) const = default;
};

// Reconcile the transfer and the device into the state the user sees.
// Total: every (transfer, cast) pair maps to exactly one result.
UnifiedStatus merge(const std::optional<model::TransferState>& transfer,
                    const std::optional<model::CastStatus>& cast,
                    model::TransferLossPolicy policy = model::TransferLossPolicy::Warn);

}  // namespace reelcast::playback
