#pragma once

#include "util/Result.hpp"
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <sys/types.h>

namespace reelcast::process {

enum class StreamSelect { Stdout, Stderr, Both };
enum class StreamSource { Stdout, Stderr };

struct LineRead {
    enum class Status { Line, Timeout, Eof };

    Status status = Status::Timeout;
    StreamSource source = StreamSource::Stdout;
    std::string text;
};

struct ProcessOutput {
    int exit_code = 0;
    std::string out;
    std::string err;
};

/**
 * A running child process with its stdout/stderr captured through pipes.
 *
 * The child runs in its own process group so kill() also reaches anything
 * it spawned. next_line() must only be called from one thread at a time;
 * is_alive(), wait(), kill() and signal() are safe from any thread.
 * Destroying the handle kills and reaps the child.
 */
class ProcessHandle {
public:
    ~ProcessHandle();

    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    pid_t pid() const { return pid_; }

    // Next complete line from the selected stream(s). Empty lines are skipped,
    // '\r' counts as a line terminator (progress redraws).
    LineRead next_line(StreamSelect which, std::chrono::milliseconds timeout);

    bool is_alive();
    std::optional<int> exit_status() const;
    std::optional<int> wait(std::chrono::milliseconds timeout);

    // SIGTERM, up to `grace` for a voluntary exit, then SIGKILL. A second
    // call, or a call after the child exited, does nothing.
    void kill(std::chrono::milliseconds grace = std::chrono::milliseconds(0));

    bool signal(int sig);

private:
    friend util::Result<std::unique_ptr<ProcessHandle>> launch(const std::string&,
                                                               const std::vector<std::string>&);

    ProcessHandle(pid_t pid, int out_fd, int err_fd);

    bool reap_locked(bool block);
    std::optional<LineRead> take_buffered(StreamSelect which);
    void fill(int& fd, std::string& buffer);

    pid_t pid_ = -1;
    int out_fd_ = -1;
    int err_fd_ = -1;
    std::string out_buf_;
    std::string err_buf_;

    mutable std::mutex mutex_;
    bool reaped_ = false;
    int exit_status_ = 0;
};

// Start `executable` (bare name looked up on PATH, or a path) with `args`.
// Fails with LaunchNotFound when nothing executable matches, SpawnFailed on
// pipe/fork/exec errors.
util::Result<std::unique_ptr<ProcessHandle>> launch(const std::string& executable,
                                                    const std::vector<std::string>& args);

// One-shot invocation: collect both streams until exit. The child is killed
// and Timeout returned when it outlives `timeout`.
util::Result<ProcessOutput> run_once(const std::string& executable,
                                     const std::vector<std::string>& args,
                                     std::chrono::milliseconds timeout);

}  // namespace reelcast::process
