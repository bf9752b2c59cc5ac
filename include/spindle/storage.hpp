/*
 * spindle - Asynchronous Render Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>

#include "spindle/types.hpp"

namespace spindle {

struct StoredArtifact {
    std::filesystem::path path;
    std::uintmax_t size = 0;
};

// Durable home for finished artifacts of owned jobs: <root>/renders/<job id><ext>.
class ArtifactStore final {
public:
    explicit ArtifactStore(std::filesystem::path root) noexcept;

    [[nodiscard]] bool prepare() noexcept;

    // Copies artifact into the store. nullopt (logged) on failure.
    [[nodiscard]] std::optional<StoredArtifact> store(const JobId& id, const std::filesystem::path& artifact) noexcept;
    void discard(const std::filesystem::path& stored) noexcept;

    // True if path resolves inside the renders directory.
    [[nodiscard]] bool contains(const std::filesystem::path& path) const noexcept;

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }
    [[nodiscard]] std::filesystem::path rendersDir() const { return root_ / "renders"; }

private:
    std::filesystem::path root_;
};

}
