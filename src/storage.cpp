/*
 * spindle - Asynchronous Render Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "spindle/storage.hpp"
#include "spindle/logger.hpp"

namespace spindle {

ArtifactStore::ArtifactStore(std::filesystem::path root) noexcept
    : root_(std::move(root)) {
}

bool ArtifactStore::prepare() noexcept {
    std::error_code ec;
    std::filesystem::create_directories(rendersDir(), ec);
    if (ec) {
        LOG_ERROR("Failed to create storage directory " + rendersDir().string() + ": " + ec.message());
        return false;
    }
    return true;
}

std::optional<StoredArtifact> ArtifactStore::store(const JobId& id, const std::filesystem::path& artifact) noexcept {
    try {
        if (!prepare()) {
            return std::nullopt;
        }
        auto finalPath = rendersDir() / (id + artifact.extension().string());
        auto tempPath = finalPath;
        tempPath += ".tmp";

        // Copy under a temporary name so readers never see a partial file
        std::filesystem::copy_file(artifact, tempPath, std::filesystem::copy_options::overwrite_existing);
        std::filesystem::rename(tempPath, finalPath);

        StoredArtifact stored{finalPath, std::filesystem::file_size(finalPath)};
        LOG_DEBUG("Stored artifact " + finalPath.string() + " (" + std::to_string(stored.size) + " bytes)");
        return stored;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to copy " + artifact.string() + " to persistent storage: " + e.what());
        return std::nullopt;
    }
}

void ArtifactStore::discard(const std::filesystem::path& stored) noexcept {
    std::error_code ec;
    std::filesystem::remove(stored, ec);
    if (ec) {
        LOG_WARN("Failed to discard stored artifact " + stored.string() + ": " + ec.message());
    }
}

bool ArtifactStore::contains(const std::filesystem::path& path) const noexcept {
    std::error_code ec;
    auto base = std::filesystem::weakly_canonical(rendersDir(), ec);
    if (ec) return false;
    auto target = std::filesystem::weakly_canonical(path, ec);
    if (ec) return false;

    auto rel = target.lexically_relative(base);
    return !rel.empty() && rel.native().rfind("..", 0) != 0;
}

}
