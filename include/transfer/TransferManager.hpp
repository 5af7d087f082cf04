#pragma once

#include "backend/Config.hpp"
#include "model/Session.hpp"
#include "util/Result.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace reelcast::events { class EventBus; }
namespace reelcast::net { class AddressResolver; }
namespace reelcast::process { class ProcessHandle; }

namespace reelcast::transfer {

struct StartOptions {
    std::optional<uint32_t> file_index;
    std::optional<uint64_t> expected_size_bytes;
};

/**
 * Owns the running transfer processes. Each session gets one reader thread
 * that turns the process output into state changes; callers only ever see
 * copies of the session record.
 *
 * Thread-safe. No lock is held while waiting on a child process.
 */
class TransferManager {
public:
    TransferManager(backend::TransferSettings settings,
                    net::AddressResolver& resolver,
                    events::EventBus* bus = nullptr);
    ~TransferManager();

    TransferManager(const TransferManager&) = delete;
    TransferManager& operator=(const TransferManager&) = delete;

    // The returned session is in Starting; the feed drives it from there
    util::Result<model::SessionId> start(const std::string& locator, const StartOptions& options = {});

    std::optional<model::TransferSession> status(const model::SessionId& id) const;
    std::vector<model::TransferSession> list() const;

    util::EmptyResult stop(const model::SessionId& id);
    void stop_all() noexcept;

    util::EmptyResult pause(const model::SessionId& id);
    util::EmptyResult resume(const model::SessionId& id);
    util::EmptyResult restart(const model::SessionId& id);

    // Children of this manager that have not exited yet
    size_t live_process_count() const;

private:
    struct Entry {
        model::TransferSession record;
        StartOptions options;
        std::string lan_address;
        std::shared_ptr<process::ProcessHandle> process;
        std::jthread reader;
        // The port reserved with the resolver; the client may advertise another
        uint16_t claimed_port = 0;
        bool port_released = true;
        uint64_t generation = 0;   // bumped on restart; stale readers are ignored
        bool stop_requested = false;
    };

    std::vector<std::string> build_args(const std::string& locator, uint16_t port,
                                        const StartOptions& options) const;
    void release_port_locked(Entry& entry);
    util::EmptyResult spawn_locked(const model::SessionId& id, Entry& entry,
                                   std::shared_ptr<process::ProcessHandle> handle);
    void reader_loop(std::stop_token stop, model::SessionId id, uint64_t generation,
                     std::shared_ptr<process::ProcessHandle> handle);
    void publish_state(const model::TransferSession& snapshot, bool state_changed,
                       bool url_resolved, bool progress_changed);

    backend::TransferSettings settings_;
    net::AddressResolver& resolver_;
    events::EventBus* bus_;

    std::map<model::SessionId, std::unique_ptr<Entry>> sessions_;
    uint64_t next_id_ = 1;
    mutable std::mutex mutex_;
};

}  // namespace reelcast::transfer
