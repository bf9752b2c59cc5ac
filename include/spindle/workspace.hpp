/*
 * spindle - Asynchronous Render Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <optional>
#include <string>

namespace spindle {

// A job's scratch directory. Removed at most once; after release() the
// path is no longer handed out.
class Workspace final {
public:
    Workspace() noexcept = default;
    explicit Workspace(std::filesystem::path path) noexcept : path_(std::move(path)) {}
    ~Workspace() = default;

    Workspace(const Workspace&) = delete;
    Workspace& operator=(const Workspace&) = delete;
    Workspace(Workspace&& other) noexcept;
    Workspace& operator=(Workspace&& other) noexcept;

    // Fresh "spindle_<random>" directory under parent.
    [[nodiscard]] static std::optional<Workspace> create(const std::filesystem::path& parent, std::string& error);

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    [[nodiscard]] bool released() const noexcept { return released_; }

    // Returns true if this call removed the directory tree. Errors are logged.
    bool release() noexcept;

private:
    std::filesystem::path path_;
    bool released_ = false;
};

}
