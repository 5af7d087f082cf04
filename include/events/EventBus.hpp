#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace reelcast::events {

struct Event {
    enum class Type {
        TransferStateChanged,   // data = new transfer state
        TransferUrlResolved,    // data = stream URL
        TransferProgress,       // progress / rate / bytes
        CastStateChanged,       // data = new cast state
        PlaybackStateChanged,   // data = unified state
        PlaybackWarning,        // data = warning text
    };
    Type type;
    std::string session_id;      // transfer session, empty for cast events
    std::string data;
    double progress = 0.0;
    uint64_t rate_bytes_per_sec = 0;
    uint64_t bytes_transferred = 0;
};

std::string_view to_string(Event::Type type);

/**
 * Publish/subscribe hub between the core and the front end. The command
 * that runs a session owns the instance and hands it to the components
 * that publish; there is no global bus.
 *
 * Handlers run on the publishing thread (often a transfer reader thread),
 * outside the bus lock, so a handler may subscribe or unsubscribe.
 */
class EventBus {
public:
    using Handler = std::function<void(const Event&)>;
    using SubscriptionId = uint64_t;

    SubscriptionId subscribe(Event::Type type, Handler handler);
    void unsubscribe(SubscriptionId id);
    void publish(const Event& event);

    size_t subscriber_count(Event::Type type) const;

private:
    std::map<Event::Type, std::vector<std::pair<SubscriptionId, Handler>>> subscribers_;
    SubscriptionId next_id_ = 1;
    mutable std::mutex mutex_;
};

}  // namespace reelcast::events
