/*
 * spindle - Asynchronous Render Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <sys/types.h>

namespace spindle {

// Variables set (or replaced) in the child on top of the inherited environment.
using Environment = std::vector<std::pair<std::string, std::string>>;

// Exit code reported when the child's status could not be collected.
inline constexpr int kExitUnknown = -1;

// A child process in its own process group with stdout and stderr merged
// into one pipe. Signals are delivered to the whole group so helpers the
// child spawns do not keep the pipe open after a kill.
class Process final {
public:
    ~Process();

    Process(const Process&) = delete;
    Process& operator=(const Process&) = delete;
    Process(Process&&) = delete;
    Process& operator=(Process&&) = delete;

    // Returns nullptr and fills error when the fork or pipe fails. A failed
    // exec shows up as exit code 127.
    [[nodiscard]] static std::unique_ptr<Process> spawn(const std::filesystem::path& executable,
                                                        const std::vector<std::string>& args,
                                                        const Environment& overrides,
                                                        std::string& error) noexcept;

    // Next line without its terminator. Returns false at end of stream.
    // Throws std::system_error if the read fails.
    [[nodiscard]] bool readLine(std::string& line);

    // Drains the stream, keeping at most the last maxBytes.
    [[nodiscard]] std::string readAll(std::size_t maxBytes = 64 * 1024);

    // Blocks until the child exits. 128 + signal for signalled children.
    int wait();
    [[nodiscard]] std::optional<int> poll();

    // SIGTERM, then SIGKILL once the grace period has passed. Reaps the child.
    void terminate(std::chrono::milliseconds grace) noexcept;

    [[nodiscard]] pid_t pid() const noexcept { return pid_; }

private:
    Process(pid_t pid, int fd) noexcept : pid_(pid), fd_(fd) {}

    std::optional<int> reapLocked(bool& gone) noexcept;
    void signalLocked(int sig) noexcept;
    void closeStream() noexcept;

    pid_t pid_;
    int fd_;
    std::string buffer_;
    bool eof_ = false;

    std::mutex stateMutex_;
    std::optional<int> exitCode_;
};

// PATH lookup. Names containing '/' are checked as given.
[[nodiscard]] std::optional<std::filesystem::path> findExecutable(const std::string& name);

}
