#include "process/ProcessLauncher.hpp"
#include "util/Logger.hpp"
#include "util/Platform.hpp"
#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <thread>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace reelcast::process {

using namespace std::chrono_literals;
using util::ErrorCode;

namespace {

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

int decode_status(int raw) {
    if (WIFEXITED(raw)) return WEXITSTATUS(raw);
    if (WIFSIGNALED(raw)) return 128 + WTERMSIG(raw);
    return -1;
}

// Pop the first non-empty line out of `buffer`. With `flush` set, a trailing
// unterminated fragment counts as a line too (stream reached EOF).
std::optional<std::string> pop_line(std::string& buffer, bool flush) {
    while (!buffer.empty()) {
        auto pos = buffer.find_first_of("\r\n");
        if (pos == std::string::npos) {
            if (!flush) return std::nullopt;
            std::string rest = std::move(buffer);
            buffer.clear();
            return rest;
        }
        std::string line = buffer.substr(0, pos);
        size_t skip = 1;
        if (buffer[pos] == '\r' && pos + 1 < buffer.size() && buffer[pos + 1] == '\n') {
            skip = 2;
        }
        buffer.erase(0, pos + skip);
        if (!line.empty()) return line;
    }
    return std::nullopt;
}

}  // namespace

ProcessHandle::ProcessHandle(pid_t pid, int out_fd, int err_fd)
    : pid_(pid), out_fd_(out_fd), err_fd_(err_fd) {}

ProcessHandle::~ProcessHandle() {
    kill(200ms);
    close_fd(out_fd_);
    close_fd(err_fd_);
}

std::optional<LineRead> ProcessHandle::take_buffered(StreamSelect which) {
    if (which != StreamSelect::Stderr) {
        if (auto line = pop_line(out_buf_, out_fd_ < 0)) {
            return LineRead{LineRead::Status::Line, StreamSource::Stdout, std::move(*line)};
        }
    }
    if (which != StreamSelect::Stdout) {
        if (auto line = pop_line(err_buf_, err_fd_ < 0)) {
            return LineRead{LineRead::Status::Line, StreamSource::Stderr, std::move(*line)};
        }
    }
    return std::nullopt;
}

void ProcessHandle::fill(int& fd, std::string& buffer) {
    std::array<char, 4096> chunk;
    while (fd >= 0) {
        ssize_t n = ::read(fd, chunk.data(), chunk.size());
        if (n > 0) {
            buffer.append(chunk.data(), static_cast<size_t>(n));
            continue;
        }
        if (n == 0) {
            close_fd(fd);
            return;
        }
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) return;
        util::Logger::warn("Process: read failed for pid " + std::to_string(pid_) + ": " + std::strerror(errno));
        close_fd(fd);
        return;
    }
}

LineRead ProcessHandle::next_line(StreamSelect which, std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;

    while (true) {
        if (auto line = take_buffered(which)) {
            return *line;
        }

        std::array<pollfd, 2> fds{};
        nfds_t count = 0;
        if (which != StreamSelect::Stderr && out_fd_ >= 0) {
            fds[count++] = pollfd{out_fd_, POLLIN, 0};
        }
        if (which != StreamSelect::Stdout && err_fd_ >= 0) {
            fds[count++] = pollfd{err_fd_, POLLIN, 0};
        }
        if (count == 0) {
            return LineRead{LineRead::Status::Eof, StreamSource::Stdout, {}};
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() < 0) remaining = 0ms;

        int ret = ::poll(fds.data(), count, static_cast<int>(remaining.count()));
        if (ret < 0) {
            if (errno == EINTR) continue;
            util::Logger::error("Process: poll failed: " + std::string(std::strerror(errno)));
            return LineRead{LineRead::Status::Eof, StreamSource::Stdout, {}};
        }
        if (ret == 0) {
            return LineRead{LineRead::Status::Timeout, StreamSource::Stdout, {}};
        }

        for (nfds_t i = 0; i < count; ++i) {
            if (fds[i].revents == 0) continue;
            if (fds[i].fd == out_fd_) {
                fill(out_fd_, out_buf_);
            } else if (fds[i].fd == err_fd_) {
                fill(err_fd_, err_buf_);
            }
        }
    }
}

bool ProcessHandle::reap_locked(bool block) {
    if (reaped_) return true;

    int raw = 0;
    pid_t ret;
    do {
        ret = ::waitpid(pid_, &raw, block ? 0 : WNOHANG);
    } while (ret < 0 && errno == EINTR);

    if (ret == pid_) {
        reaped_ = true;
        exit_status_ = decode_status(raw);
        util::Logger::debug("Process: pid " + std::to_string(pid_) + " exited with status " +
            std::to_string(exit_status_));
        return true;
    }
    if (ret < 0) {
        // ECHILD: somebody else reaped it; treat as gone
        reaped_ = true;
        exit_status_ = -1;
        return true;
    }
    return false;
}

bool ProcessHandle::is_alive() {
    std::lock_guard<std::mutex> lock(mutex_);
    return !reap_locked(false);
}

std::optional<int> ProcessHandle::exit_status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!reaped_) return std::nullopt;
    return exit_status_;
}

std::optional<int> ProcessHandle::wait(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (reap_locked(false)) return exit_status_;
        }
        if (std::chrono::steady_clock::now() >= deadline) return std::nullopt;
        std::this_thread::sleep_for(10ms);
    }
}

void ProcessHandle::kill(std::chrono::milliseconds grace) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (reap_locked(false)) return;

    util::Logger::debug("Process: terminating pid " + std::to_string(pid_));
    ::kill(-pid_, SIGTERM);
    ::kill(-pid_, SIGCONT);  // a stopped group cannot act on SIGTERM

    auto deadline = std::chrono::steady_clock::now() + grace;
    while (std::chrono::steady_clock::now() < deadline) {
        if (reap_locked(false)) return;
        std::this_thread::sleep_for(20ms);
    }
    if (reap_locked(false)) return;

    util::Logger::debug("Process: pid " + std::to_string(pid_) + " ignored SIGTERM, sending SIGKILL");
    ::kill(-pid_, SIGKILL);
    reap_locked(true);
}

bool ProcessHandle::signal(int sig) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (reap_locked(false)) return false;
    return ::kill(-pid_, sig) == 0;
}

util::Result<std::unique_ptr<ProcessHandle>> launch(const std::string& executable,
                                                    const std::vector<std::string>& args) {
    using R = util::Result<std::unique_ptr<ProcessHandle>>;

    auto resolved = util::Platform::find_executable(executable);
    if (!resolved) {
        util::Logger::warn("Process: executable not found: " + executable);
        return R::err(ErrorCode::LaunchNotFound, executable + " not found");
    }

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};  // child reports exec errno here
    if (::pipe2(out_pipe, O_CLOEXEC) != 0 || ::pipe2(err_pipe, O_CLOEXEC) != 0 ||
        ::pipe2(exec_pipe, O_CLOEXEC) != 0) {
        int saved = errno;
        for (int* p : {out_pipe, err_pipe, exec_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
        return R::err(ErrorCode::SpawnFailed, std::string("pipe failed: ") + std::strerror(saved));
    }

    // argv must be built before fork: no allocation in the child
    std::vector<char*> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char*>(executable.c_str()));
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);
    std::string path = resolved->string();

    pid_t pid = ::fork();
    if (pid < 0) {
        int saved = errno;
        for (int* p : {out_pipe, err_pipe, exec_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
        return R::err(ErrorCode::SpawnFailed, std::string("fork failed: ") + std::strerror(saved));
    }

    if (pid == 0) {
        ::setpgid(0, 0);
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
        }
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        ::signal(SIGPIPE, SIG_DFL);
        ::execv(path.c_str(), argv.data());
        int err = errno;
        ssize_t ignored = ::write(exec_pipe[1], &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    // Also set from the parent so kill(-pid) works even if the child has
    // not been scheduled yet
    ::setpgid(pid, pid);

    ::close(out_pipe[1]);
    ::close(err_pipe[1]);
    ::close(exec_pipe[1]);

    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(exec_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    ::close(exec_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        int raw = 0;
        ::waitpid(pid, &raw, 0);
        ::close(out_pipe[0]);
        ::close(err_pipe[0]);
        auto code = (child_errno == ENOENT) ? ErrorCode::LaunchNotFound : ErrorCode::SpawnFailed;
        return R::err(code, "exec " + path + " failed: " + std::strerror(child_errno));
    }

    for (int fd : {out_pipe[0], err_pipe[0]}) {
        int flags = ::fcntl(fd, F_GETFL, 0);
        ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }

    util::Logger::debug("Process: launched " + path + " as pid " + std::to_string(pid));
    return R::ok(std::unique_ptr<ProcessHandle>(new ProcessHandle(pid, out_pipe[0], err_pipe[0])));
}

util::Result<ProcessOutput> run_once(const std::string& executable,
                                     const std::vector<std::string>& args,
                                     std::chrono::milliseconds timeout) {
    using R = util::Result<ProcessOutput>;

    auto launched = launch(executable, args);
    if (launched.is_err()) {
        return launched.error();
    }
    auto handle = std::move(launched.value());

    auto deadline = std::chrono::steady_clock::now() + timeout;
    auto remaining = [&]() {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        return left.count() > 0 ? left : 0ms;
    };

    ProcessOutput output;
    while (true) {
        auto left = remaining();
        if (left.count() == 0) {
            handle->kill();
            util::Logger::warn("Process: " + executable + " timed out after " +
                std::to_string(timeout.count()) + " ms");
            return R::err(ErrorCode::Timeout, executable + " did not finish within " +
                std::to_string(timeout.count()) + " ms");
        }

        auto read = handle->next_line(StreamSelect::Both, left);
        if (read.status == LineRead::Status::Eof) break;
        if (read.status == LineRead::Status::Timeout) continue;

        auto& sink = (read.source == StreamSource::Stdout) ? output.out : output.err;
        if (!sink.empty()) sink += '\n';
        sink += read.text;
    }

    auto status = handle->wait(remaining());
    if (!status) {
        handle->kill();
        return R::err(ErrorCode::Timeout, executable + " closed its output but did not exit");
    }
    output.exit_code = *status;
    return R::ok(std::move(output));
}

}  // namespace reelcast::process
