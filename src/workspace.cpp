/*
 * spindle - Asynchronous Render Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "spindle/workspace.hpp"
#include "spindle/logger.hpp"
#include <cstdlib>
#include <cstring>
#include <cerrno>

namespace spindle {

Workspace::Workspace(Workspace&& other) noexcept
    : path_(std::move(other.path_)), released_(other.released_) {
    other.released_ = true;
}

Workspace& Workspace::operator=(Workspace&& other) noexcept {
    if (this != &other) {
        path_ = std::move(other.path_);
        released_ = other.released_;
        other.released_ = true;
    }
    return *this;
}

std::optional<Workspace> Workspace::create(const std::filesystem::path& parent, std::string& error) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
        error = "Failed to create scratch root " + parent.string() + ": " + ec.message();
        return std::nullopt;
    }

    std::string pattern = (parent / "spindle_XXXXXX").string();
    if (::mkdtemp(pattern.data()) == nullptr) {
        error = "Failed to create workspace under " + parent.string() + ": " + std::strerror(errno);
        return std::nullopt;
    }
    LOG_DEBUG("Workspace created: " + pattern);
    return Workspace(std::filesystem::path(pattern));
}

bool Workspace::release() noexcept {
    if (released_ || path_.empty()) {
        return false;
    }
    released_ = true;

    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    if (ec) {
        LOG_WARN("Failed to remove workspace " + path_.string() + ": " + ec.message());
    } else {
        LOG_DEBUG("Workspace removed: " + path_.string());
    }
    return true;
}

}
