#include "transfer/TransferManager.hpp"
#include "events/EventBus.hpp"
#include "net/AddressResolver.hpp"
#include "process/ProcessLauncher.hpp"
#include "transfer/OutputGrammar.hpp"
#include "util/Logger.hpp"
#include <csignal>
#include <format>

namespace reelcast::transfer {

using namespace std::chrono_literals;
using model::TransferSession;
using model::TransferState;
using util::ErrorCode;

namespace {

constexpr auto kReadSlice = 200ms;

}  // namespace

TransferManager::TransferManager(backend::TransferSettings settings,
                                 net::AddressResolver& resolver,
                                 events::EventBus* bus)
    : settings_(std::move(settings)), resolver_(resolver), bus_(bus) {}

TransferManager::~TransferManager() {
    stop_all();
}

std::vector<std::string> TransferManager::build_args(const std::string& locator, uint16_t port,
                                                     const StartOptions& options) const {
    std::vector<std::string> args = {locator, "--port", std::to_string(port)};
    if (options.file_index) {
        args.push_back("-s");
        args.push_back(std::to_string(*options.file_index));
    }
    args.push_back("--not-on-top");
    args.push_back("--keep-seeding");
    args.insert(args.end(), settings_.extra_args.begin(), settings_.extra_args.end());
    return args;
}

util::Result<model::SessionId> TransferManager::start(const std::string& locator,
                                                      const StartOptions& options) {
    if (auto valid = validate_locator(locator); valid.is_err()) {
        util::Logger::warn("Transfer: Rejected locator: " + valid.error().message);
        return valid.error();
    }

    auto port = resolver_.claim_port(settings_.port);
    if (port.is_err()) {
        return port.error();
    }

    auto launched = process::launch(settings_.webtorrent_path, build_args(locator, port.value(), options));
    if (launched.is_err()) {
        resolver_.release_port(port.value());
        util::Logger::error("Transfer: Cannot start " + settings_.webtorrent_path + ": " +
            launched.error().message);
        return launched.error();
    }
    std::shared_ptr<process::ProcessHandle> handle = std::move(launched.value());

    std::string lan = resolver_.lan_address();

    std::lock_guard<std::mutex> lock(mutex_);
    model::SessionId id = "ts-" + std::to_string(next_id_++);

    auto entry = std::make_unique<Entry>();
    entry->record.id = id;
    entry->record.locator = locator;
    entry->record.file_index = options.file_index;
    entry->record.port = port.value();
    entry->claimed_port = port.value();
    entry->port_released = false;
    entry->record.total_bytes = options.expected_size_bytes;
    entry->options = options;
    entry->lan_address = lan;

    auto& ref = *entry;
    sessions_.emplace(id, std::move(entry));
    if (auto spawned = spawn_locked(id, ref, handle); spawned.is_err()) {
        return spawned.error();
    }

    util::Logger::info(std::format("Transfer: Started {} (pid {}, port {})", id, handle->pid(), port.value()));
    return id;
}

void TransferManager::release_port_locked(Entry& entry) {
    if (entry.port_released) return;
    resolver_.release_port(entry.claimed_port);
    entry.port_released = true;
}

util::EmptyResult TransferManager::spawn_locked(const model::SessionId& id, Entry& entry,
                                                std::shared_ptr<process::ProcessHandle> handle) {
    entry.process = handle;
    uint64_t generation = entry.generation;
    try {
        entry.reader = std::jthread([this, id, generation, handle](std::stop_token stop) {
            reader_loop(stop, id, generation, handle);
        });
    } catch (const std::system_error& e) {
        handle->kill();
        entry.process.reset();
        entry.record.state = TransferState::error(std::string("cannot start reader thread: ") + e.what());
        release_port_locked(entry);
        return util::make_error(ErrorCode::SpawnFailed, entry.record.state.reason);
    }
    return util::success();
}

void TransferManager::reader_loop(std::stop_token stop, model::SessionId id, uint64_t generation,
                                  std::shared_ptr<process::ProcessHandle> handle) {
    util::Logger::debug("Transfer: Reader for " + id + " running");

    while (!stop.stop_requested()) {
        auto read = handle->next_line(process::StreamSelect::Both, kReadSlice);
        if (read.status == process::LineRead::Status::Timeout) continue;
        if (read.status == process::LineRead::Status::Eof) break;

        auto event = parse_transfer_line(read.text);
        if (!event) {
            util::Logger::debug("Transfer: [" + id + "] " + read.text);
            continue;
        }

        TransferSession snapshot;
        ApplyOutcome outcome;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = sessions_.find(id);
            if (it == sessions_.end() || it->second->generation != generation || it->second->stop_requested) {
                return;
            }
            outcome = apply_event(it->second->record, *event, it->second->lan_address);
            snapshot = it->second->record;
        }
        if (outcome.state_changed) {
            util::Logger::info("Transfer: " + id + " is now " + model::to_string(snapshot.state));
        }
        publish_state(snapshot, outcome.state_changed, outcome.url_resolved, outcome.progress_changed);
    }

    // Output closed: wait for the exit status unless we are being stopped
    std::optional<int> status;
    while (!stop.stop_requested() && !status) {
        status = handle->wait(kReadSlice);
    }
    if (!status) return;

    TransferSession snapshot;
    ApplyOutcome outcome;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(id);
        if (it == sessions_.end() || it->second->generation != generation || it->second->stop_requested) {
            return;
        }
        outcome = apply_exit(it->second->record, *status);
        release_port_locked(*it->second);
        snapshot = it->second->record;
    }
    util::Logger::warn("Transfer: " + id + " process exited: " + model::to_string(snapshot.state));
    publish_state(snapshot, outcome.state_changed, false, false);
}

void TransferManager::publish_state(const TransferSession& snapshot, bool state_changed,
                                    bool url_resolved, bool progress_changed) {
    if (!bus_) return;

    if (state_changed) {
        bus_->publish({events::Event::Type::TransferStateChanged, snapshot.id,
                       model::to_string(snapshot.state)});
    }
    if (url_resolved && snapshot.stream_url) {
        bus_->publish({events::Event::Type::TransferUrlResolved, snapshot.id, *snapshot.stream_url});
    }
    if (progress_changed) {
        events::Event event{events::Event::Type::TransferProgress, snapshot.id, {}};
        event.progress = snapshot.progress;
        event.rate_bytes_per_sec = snapshot.rate_bytes_per_sec;
        event.bytes_transferred = snapshot.bytes_transferred;
        bus_->publish(event);
    }
}

std::optional<TransferSession> TransferManager::status(const model::SessionId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) return std::nullopt;
    return it->second->record;
}

std::vector<TransferSession> TransferManager::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TransferSession> out;
    out.reserve(sessions_.size());
    for (const auto& [id, entry] : sessions_) {
        out.push_back(entry->record);
    }
    return out;
}

util::EmptyResult TransferManager::stop(const model::SessionId& id) {
    std::shared_ptr<process::ProcessHandle> handle;
    std::jthread reader;
    TransferSession snapshot;
    bool changed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(id);
        if (it == sessions_.end()) {
            return util::make_error(ErrorCode::SessionNotFound, "no transfer session " + id);
        }
        Entry& entry = *it->second;
        entry.stop_requested = true;
        handle = std::move(entry.process);
        reader = std::move(entry.reader);
        if (entry.record.state.kind != TransferState::Kind::Stopped &&
            entry.record.state.kind != TransferState::Kind::Error) {
            entry.record.state = TransferState::of(TransferState::Kind::Stopped);
            changed = true;
        }
        release_port_locked(entry);
        snapshot = entry.record;
    }

    if (handle) {
        handle->kill(std::chrono::milliseconds(settings_.stop_grace_ms));
    }
    if (reader.joinable()) {
        reader.request_stop();
        reader.join();
    }

    if (changed) {
        util::Logger::info("Transfer: Stopped " + id);
        publish_state(snapshot, true, false, false);
    }
    return util::success();
}

void TransferManager::stop_all() noexcept {
    std::vector<model::SessionId> ids;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, entry] : sessions_) {
            ids.push_back(id);
        }
    }
    for (const auto& id : ids) {
        try {
            auto stopped = stop(id);
            if (stopped.is_err()) {
                util::Logger::warn("Transfer: stop_all: " + stopped.error().message);
            }
        } catch (const std::exception& e) {
            util::Logger::error(std::string("Transfer: stop_all failed for ") + id + ": " + e.what());
        }
    }
}

util::EmptyResult TransferManager::pause(const model::SessionId& id) {
    TransferSession snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(id);
        if (it == sessions_.end()) {
            return util::make_error(ErrorCode::SessionNotFound, "no transfer session " + id);
        }
        Entry& entry = *it->second;
        if (entry.record.state.kind != TransferState::Kind::Streaming || !entry.process) {
            return util::make_error(ErrorCode::InvalidState,
                "cannot pause a transfer that is " + model::to_string(entry.record.state));
        }
        if (!entry.process->signal(SIGSTOP)) {
            return util::make_error(ErrorCode::InvalidState, "transfer process is no longer running");
        }
        entry.record.state = TransferState::of(TransferState::Kind::Paused);
        snapshot = entry.record;
    }
    util::Logger::info("Transfer: Paused " + id);
    publish_state(snapshot, true, false, false);
    return util::success();
}

util::EmptyResult TransferManager::resume(const model::SessionId& id) {
    TransferSession snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(id);
        if (it == sessions_.end()) {
            return util::make_error(ErrorCode::SessionNotFound, "no transfer session " + id);
        }
        Entry& entry = *it->second;
        if (entry.record.state.kind != TransferState::Kind::Paused || !entry.process) {
            return util::make_error(ErrorCode::InvalidState,
                "cannot resume a transfer that is " + model::to_string(entry.record.state));
        }
        if (!entry.process->signal(SIGCONT)) {
            return util::make_error(ErrorCode::InvalidState, "transfer process is no longer running");
        }
        entry.record.state = TransferState::of(TransferState::Kind::Streaming);
        snapshot = entry.record;
    }
    util::Logger::info("Transfer: Resumed " + id);
    publish_state(snapshot, true, false, false);
    return util::success();
}

util::EmptyResult TransferManager::restart(const model::SessionId& id) {
    std::shared_ptr<process::ProcessHandle> old_handle;
    std::jthread old_reader;
    std::string locator;
    StartOptions options;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(id);
        if (it == sessions_.end()) {
            return util::make_error(ErrorCode::SessionNotFound, "no transfer session " + id);
        }
        Entry& entry = *it->second;
        entry.generation++;
        entry.stop_requested = false;
        old_handle = std::move(entry.process);
        old_reader = std::move(entry.reader);
        release_port_locked(entry);
        locator = entry.record.locator;
        options = entry.options;
    }

    if (old_handle) {
        old_handle->kill(std::chrono::milliseconds(settings_.stop_grace_ms));
    }
    if (old_reader.joinable()) {
        old_reader.request_stop();
        old_reader.join();
    }

    auto fail = [&](const util::Error& error) -> util::EmptyResult {
        TransferSession snapshot;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = sessions_.find(id);
            if (it != sessions_.end()) {
                it->second->record.state = TransferState::error(error.message);
                snapshot = it->second->record;
            }
        }
        util::Logger::error("Transfer: Restart of " + id + " failed: " + error.message);
        publish_state(snapshot, true, false, false);
        return error;
    };

    auto port = resolver_.claim_port(settings_.port);
    if (port.is_err()) {
        return fail(port.error());
    }
    auto launched = process::launch(settings_.webtorrent_path, build_args(locator, port.value(), options));
    if (launched.is_err()) {
        resolver_.release_port(port.value());
        return fail(launched.error());
    }
    std::shared_ptr<process::ProcessHandle> handle = std::move(launched.value());
    std::string lan = resolver_.lan_address();

    TransferSession snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(id);
        if (it == sessions_.end()) {
            resolver_.release_port(port.value());
            return util::make_error(ErrorCode::SessionNotFound, "transfer session " + id + " vanished");
        }
        Entry& entry = *it->second;
        auto& record = entry.record;
        record.state = TransferState::of(TransferState::Kind::Starting);
        record.stream_url.reset();
        record.port = port.value();
        entry.claimed_port = port.value();
        entry.port_released = false;
        record.progress = 0.0;
        record.rate_bytes_per_sec = 0;
        record.bytes_transferred = 0;
        record.total_bytes = options.expected_size_bytes;
        record.peers.reset();
        record.restarts++;
        entry.lan_address = lan;
        if (auto spawned = spawn_locked(id, entry, handle); spawned.is_err()) {
            return spawned.error();
        }
        snapshot = record;
    }

    util::Logger::info(std::format("Transfer: Restarted {} on port {} (restart #{})",
        id, snapshot.port, snapshot.restarts));
    publish_state(snapshot, true, false, true);
    return util::success();
}

size_t TransferManager::live_process_count() const {
    std::vector<std::shared_ptr<process::ProcessHandle>> handles;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, entry] : sessions_) {
            if (entry->process) handles.push_back(entry->process);
        }
    }
    size_t alive = 0;
    for (const auto& handle : handles) {
        if (handle->is_alive()) alive++;
    }
    return alive;
}

}  // namespace reelcast::transfer
