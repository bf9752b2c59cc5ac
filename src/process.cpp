/*
 * spindle - Asynchronous Render Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "spindle/process.hpp"
#include "spindle/logger.hpp"
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <system_error>
#include <thread>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace spindle {

namespace {
constexpr auto kPollInterval = std::chrono::milliseconds(20);

int decodeStatus(int status) noexcept {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return kExitUnknown;
}

std::vector<std::string> buildEnvironment(const Environment& overrides) {
    std::vector<std::string> env;
    for (char** entry = environ; entry && *entry; ++entry) {
        std::string item(*entry);
        auto eq = item.find('=');
        std::string key = item.substr(0, eq);
        bool replaced = false;
        for (const auto& kv : overrides) {
            if (kv.first == key) {
                replaced = true;
                break;
            }
        }
        if (!replaced) {
            env.push_back(std::move(item));
        }
    }
    for (const auto& kv : overrides) {
        env.push_back(kv.first + "=" + kv.second);
    }
    return env;
}

std::vector<char*> toArgv(std::vector<std::string>& items) {
    std::vector<char*> argv;
    argv.reserve(items.size() + 1);
    for (auto& item : items) {
        argv.push_back(item.data());
    }
    argv.push_back(nullptr);
    return argv;
}

bool isExecutableFile(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec) && ::access(path.c_str(), X_OK) == 0;
}
}

std::unique_ptr<Process> Process::spawn(const std::filesystem::path& executable,
                                        const std::vector<std::string>& args,
                                        const Environment& overrides,
                                        std::string& error) noexcept {
    try {
        // Everything the child touches is prepared before fork().
        std::vector<std::string> argItems;
        argItems.reserve(args.size() + 1);
        argItems.push_back(executable.string());
        argItems.insert(argItems.end(), args.begin(), args.end());
        std::vector<std::string> envItems = buildEnvironment(overrides);
        std::vector<char*> argv = toArgv(argItems);
        std::vector<char*> envp = toArgv(envItems);
        std::string exe = executable.string();

        int fds[2];
        if (::pipe2(fds, O_CLOEXEC) != 0) {
            error = std::string("pipe failed: ") + std::strerror(errno);
            return nullptr;
        }

        pid_t pid = ::fork();
        if (pid < 0) {
            error = std::string("fork failed: ") + std::strerror(errno);
            ::close(fds[0]);
            ::close(fds[1]);
            return nullptr;
        }

        if (pid == 0) {
            ::setpgid(0, 0);
            int devnull = ::open("/dev/null", O_RDONLY);
            if (devnull >= 0) {
                ::dup2(devnull, STDIN_FILENO);
            }
            ::dup2(fds[1], STDOUT_FILENO);
            ::dup2(fds[1], STDERR_FILENO);
            ::execve(exe.c_str(), argv.data(), envp.data());
            _exit(127);
        }

        // Also set from the parent so the group exists before any signal is sent.
        ::setpgid(pid, pid);
        ::close(fds[1]);
        LOG_DEBUG("Spawned pid " + std::to_string(pid) + ": " + exe);
        return std::unique_ptr<Process>(new Process(pid, fds[0]));
    } catch (const std::exception& e) {
        error = std::string("spawn failed: ") + e.what();
        return nullptr;
    }
}

Process::~Process() {
    if (!poll()) {
        LOG_WARN("Process " + std::to_string(pid_) + " still running at release, killing");
        terminate(std::chrono::milliseconds(0));
    }
    closeStream();
}

bool Process::readLine(std::string& line) {
    while (true) {
        auto nl = buffer_.find('\n');
        if (nl != std::string::npos) {
            line.assign(buffer_, 0, nl);
            buffer_.erase(0, nl + 1);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            return true;
        }

        if (eof_) {
            if (buffer_.empty()) {
                return false;
            }
            line.swap(buffer_);
            buffer_.clear();
            return true;
        }

        char chunk[4096];
        ssize_t n = ::read(fd_, chunk, sizeof(chunk));
        if (n > 0) {
            buffer_.append(chunk, static_cast<std::size_t>(n));
        } else if (n == 0) {
            eof_ = true;
        } else if (errno != EINTR) {
            throw std::system_error(errno, std::generic_category(), "read from pid " + std::to_string(pid_));
        }
    }
}

std::string Process::readAll(std::size_t maxBytes) {
    std::string out;
    std::string line;
    while (readLine(line)) {
        out += line;
        out += '\n';
        if (out.size() > maxBytes) {
            out.erase(0, out.size() - maxBytes);
        }
    }
    return out;
}

int Process::wait() {
    while (true) {
        if (auto code = poll()) {
            return *code;
        }
        std::this_thread::sleep_for(kPollInterval);
    }
}

std::optional<int> Process::poll() {
    std::lock_guard<std::mutex> lock(stateMutex_);
    bool gone = false;
    return reapLocked(gone);
}

void Process::terminate(std::chrono::milliseconds grace) noexcept {
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        bool gone = false;
        if (reapLocked(gone)) {
            return;
        }
        signalLocked(SIGTERM);
    }

    auto deadline = std::chrono::steady_clock::now() + grace;
    while (std::chrono::steady_clock::now() < deadline) {
        if (poll()) {
            return;
        }
        std::this_thread::sleep_for(kPollInterval);
    }

    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        bool gone = false;
        if (reapLocked(gone)) {
            return;
        }
        LOG_DEBUG("Process " + std::to_string(pid_) + " ignored SIGTERM, sending SIGKILL");
        signalLocked(SIGKILL);
    }
    (void)wait();
}

std::optional<int> Process::reapLocked(bool& gone) noexcept {
    if (exitCode_) {
        gone = true;
        return exitCode_;
    }
    int status = 0;
    pid_t r = ::waitpid(pid_, &status, WNOHANG);
    if (r == pid_) {
        exitCode_ = decodeStatus(status);
    } else if (r < 0 && errno != EINTR) {
        LOG_ERROR("waitpid(" + std::to_string(pid_) + ") failed: " + std::strerror(errno));
        exitCode_ = kExitUnknown;
    }
    gone = exitCode_.has_value();
    return exitCode_;
}

void Process::signalLocked(int sig) noexcept {
    // Reaped pids may be reused; callers hold stateMutex_ and have checked exitCode_.
    if (::kill(-pid_, sig) != 0 && ::kill(pid_, sig) != 0 && errno != ESRCH) {
        LOG_WARN("kill(" + std::to_string(pid_) + ", " + std::to_string(sig) + ") failed: " + std::strerror(errno));
    }
}

void Process::closeStream() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

std::optional<std::filesystem::path> findExecutable(const std::string& name) {
    if (name.empty()) {
        return std::nullopt;
    }
    if (name.find('/') != std::string::npos) {
        if (isExecutableFile(name)) {
            return std::filesystem::path(name);
        }
        return std::nullopt;
    }

    const char* pathEnv = std::getenv("PATH");
    std::string dirs = pathEnv ? pathEnv : "/usr/local/bin:/usr/bin:/bin";
    std::size_t start = 0;
    while (start <= dirs.size()) {
        auto end = dirs.find(':', start);
        if (end == std::string::npos) {
            end = dirs.size();
        }
        std::string dir = dirs.substr(start, end - start);
        auto candidate = std::filesystem::path(dir.empty() ? "." : dir) / name;
        if (isExecutableFile(candidate)) {
            return candidate;
        }
        start = end + 1;
    }
    return std::nullopt;
}

}
