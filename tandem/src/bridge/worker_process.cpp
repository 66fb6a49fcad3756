#include "worker_process.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <mutex>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace tandem_bridge {

namespace {

// A worker that died must show up as a failed write, not kill the bridge.
void ignoreSigpipe() {
    static std::once_flag once;
    std::call_once(once, [] { std::signal(SIGPIPE, SIG_IGN); });
}

std::string trim(const std::string &in) {
    const auto first = in.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    const auto last = in.find_last_not_of(" \t\r\n");
    return in.substr(first, last - first + 1);
}

} // namespace

WorkerProcess::WorkerProcess(std::string command) : command_(std::move(command)) {}

WorkerProcess::~WorkerProcess() {
    kill();
}

bool WorkerProcess::start(std::string &error) {
    ignoreSigpipe();

    int to_child[2] = {-1, -1};
    int from_child[2] = {-1, -1};
    if (::pipe2(to_child, O_CLOEXEC) != 0) {
        error = std::string("pipe: ") + std::strerror(errno);
        return false;
    }
    if (::pipe2(from_child, O_CLOEXEC) != 0) {
        error = std::string("pipe: ") + std::strerror(errno);
        ::close(to_child[0]);
        ::close(to_child[1]);
        return false;
    }

    const pid_t pid = ::fork();
    if (pid < 0) {
        error = std::string("fork: ") + std::strerror(errno);
        for (int fd : {to_child[0], to_child[1], from_child[0], from_child[1]}) ::close(fd);
        return false;
    }

    if (pid == 0) {
        ::setpgid(0, 0);
        ::dup2(to_child[0], STDIN_FILENO);
        ::dup2(from_child[1], STDOUT_FILENO);
        ::dup2(from_child[1], STDERR_FILENO);
        std::signal(SIGPIPE, SIG_DFL);
        ::execl("/bin/sh", "sh", "-c", command_.c_str(), static_cast<char *>(nullptr));
        ::_exit(127);
    }

    ::setpgid(pid, pid);
    ::close(to_child[0]);
    ::close(from_child[1]);
    pid_ = pid;
    stdin_fd_ = to_child[1];
    stdout_fd_ = from_child[0];
    buffer_.clear();
    eof_ = false;
    exit_code_.reset();
    group_gone_ = false;
    return true;
}

bool WorkerProcess::writeLine(std::string_view line) {
    if (stdin_fd_ < 0) return false;
    std::string data(line);
    data.push_back('\n');
    std::size_t written = 0;
    while (written < data.size()) {
        const ssize_t n = ::write(stdin_fd_, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        written += static_cast<std::size_t>(n);
    }
    return true;
}

std::optional<std::string> WorkerProcess::takeBufferedLine() {
    const auto nl = buffer_.find('\n');
    if (nl == std::string::npos) return std::nullopt;
    std::string line = buffer_.substr(0, nl);
    buffer_.erase(0, nl + 1);
    return trim(line);
}

ReadResult WorkerProcess::readLine(std::chrono::milliseconds timeout) {
    using clock = std::chrono::steady_clock;
    const auto deadline = clock::now() + timeout;

    for (;;) {
        if (auto line = takeBufferedLine()) return ReadResult{ReadStatus::Line, std::move(*line)};
        if (eof_ || stdout_fd_ < 0) {
            if (!buffer_.empty()) {
                std::string rest = trim(buffer_);
                buffer_.clear();
                return ReadResult{ReadStatus::Line, std::move(rest)};
            }
            return ReadResult{ReadStatus::Closed, {}};
        }

        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now());
        if (remaining.count() <= 0) return ReadResult{ReadStatus::Timeout, {}};

        pollfd pfd{stdout_fd_, POLLIN, 0};
        const int ready = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ready < 0) {
            if (errno == EINTR) continue;
            eof_ = true;
            continue;
        }
        if (ready == 0) return ReadResult{ReadStatus::Timeout, {}};

        char chunk[4096];
        const ssize_t n = ::read(stdout_fd_, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            eof_ = true;
        } else if (n == 0) {
            eof_ = true;
        } else {
            buffer_.append(chunk, static_cast<std::size_t>(n));
        }
    }
}

bool WorkerProcess::reap(bool block) {
    if (pid_ <= 0 || exit_code_) return true;
    int status = 0;
    const pid_t r = ::waitpid(pid_, &status, block ? 0 : WNOHANG);
    if (r == pid_) {
        exit_code_ = WIFEXITED(status) ? WEXITSTATUS(status) : 128 + WTERMSIG(status);
        if (::kill(-pid_, 0) != 0 && errno == ESRCH) group_gone_ = true;
        return true;
    }
    if (r < 0 && errno == ECHILD) {
        exit_code_ = -1;
        return true;
    }
    return false;
}

bool WorkerProcess::running() {
    if (pid_ <= 0) return false;
    return !reap(false);
}

std::optional<int> WorkerProcess::waitExit(std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!reap(false)) {
        if (std::chrono::steady_clock::now() >= deadline) return std::nullopt;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return exit_code_;
}

void WorkerProcess::closePipes() {
    if (stdin_fd_ >= 0) ::close(stdin_fd_);
    if (stdout_fd_ >= 0) ::close(stdout_fd_);
    stdin_fd_ = -1;
    stdout_fd_ = -1;
}

bool WorkerProcess::groupAlive() const {
    if (pid_ <= 0 || group_gone_) return false;
    return ::kill(-pid_, 0) == 0 || errno == EPERM;
}

void WorkerProcess::kill() {
    closePipes();
    if (pid_ <= 0) return;
    // Descendants of the shell may outlive it; the group goes down together.
    if (!group_gone_ && ::kill(-pid_, SIGKILL) != 0 && errno == ESRCH) group_gone_ = true;
    if (!exit_code_) {
        ::kill(pid_, SIGKILL);
        reap(true);
    }
    group_gone_ = true;
    pid_ = -1;
}

} // namespace tandem_bridge
