#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

#include <sys/types.h>

namespace tandem_bridge {

enum class ReadStatus { Line, Timeout, Closed };

struct ReadResult {
    ReadStatus status = ReadStatus::Timeout;
    std::string line;

    bool isLine() const { return status == ReadStatus::Line; }
};

// A child process started through /bin/sh -c with its stdin and stdout (stderr
// merged) attached to pipes. The child runs in its own process group, which is
// killed as a whole.
class WorkerProcess {
public:
    explicit WorkerProcess(std::string command);
    ~WorkerProcess();

    WorkerProcess(const WorkerProcess &) = delete;
    WorkerProcess &operator=(const WorkerProcess &) = delete;

    bool start(std::string &error);

    // Writes the line plus '\n'. False once the child stopped reading.
    bool writeLine(std::string_view line);

    // Next complete line with surrounding whitespace removed, or Timeout, or Closed
    // after end of stream.
    ReadResult readLine(std::chrono::milliseconds timeout);

    bool running();
    // Kills the whole process group. Safe to call again and after the child exited.
    void kill();

    // True while any process of the child's group is still alive.
    bool groupAlive() const;

    // Waits up to timeout for the child to exit and returns its exit status if it did.
    std::optional<int> waitExit(std::chrono::milliseconds timeout);

    std::optional<int> exitCode() const { return exit_code_; }
    pid_t pid() const { return pid_; }
    const std::string &command() const { return command_; }

private:
    bool reap(bool block);
    void closePipes();
    std::optional<std::string> takeBufferedLine();

    std::string command_;
    pid_t pid_ = -1;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    std::string buffer_;
    bool eof_ = false;
    std::optional<int> exit_code_;
    // Set once the group was seen empty; its id may then be reused by another process.
    bool group_gone_ = false;
};

} // namespace tandem_bridge
