#include "events/EventBus.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <format>

namespace reelcast::events {

std::string_view to_string(Event::Type type) {
    switch (type) {
        case Event::Type::TransferStateChanged: return "transfer_state";
        case Event::Type::TransferUrlResolved:  return "transfer_url";
        case Event::Type::TransferProgress:     return "transfer_progress";
        case Event::Type::CastStateChanged:     return "cast_state";
        case Event::Type::PlaybackStateChanged: return "playback_state";
        case Event::Type::PlaybackWarning:      return "playback_warning";
    }
    return "unknown";
}

EventBus::SubscriptionId EventBus::subscribe(Event::Type type, Handler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    SubscriptionId id = next_id_++;
    subscribers_[type].emplace_back(id, std::move(handler));
    util::Logger::debug(std::format("EventBus: Subscription {} to {}", id, to_string(type)));
    return id;
}

void EventBus::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [type, handlers] : subscribers_) {
        std::erase_if(handlers, [id](const auto& entry) { return entry.first == id; });
    }
}

void EventBus::publish(const Event& event) {
    // Copy handlers to avoid holding lock during execution
    std::vector<Handler> handlers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = subscribers_.find(event.type);
        if (it != subscribers_.end()) {
            handlers.reserve(it->second.size());
            for (const auto& entry : it->second) {
                handlers.push_back(entry.second);
            }
        }
    }

    for (const auto& handler : handlers) {
        handler(event);
    }
}

size_t EventBus::subscriber_count(Event::Type type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = subscribers_.find(type);
    return it == subscribers_.end() ? 0 : it->second.size();
}

}  // namespace reelcast::events
